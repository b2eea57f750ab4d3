#pragma once

#include <string>
#include <variant>
#include <functional>

enum progress_stage_t {
    PROGRESS_STAGE_RAW = 0,
    PROGRESS_STAGE_GENERATE = 1,
    PROGRESS_STAGE_POST = 2
};

struct ProgressStageStarted {
    progress_stage_t stage;
    size_t total;
};

struct ProgressItemDone {
    progress_stage_t stage;
    std::string name;
    bool success;
    // item was already uploaded, nothing has been run
    bool skipped;
};

typedef std::variant<ProgressStageStarted, ProgressItemDone> ProgressEvent;

// called synchronously from the pipeline thread
typedef std::function<void(const ProgressEvent &)> ProgressObserver;

inline const char *stage_name(progress_stage_t stage) {
    switch (stage) {
        case PROGRESS_STAGE_RAW:
            return "Raw";
        case PROGRESS_STAGE_GENERATE:
            return "ParPar";
        case PROGRESS_STAGE_POST:
            return "Nyuu";
    }
    return "";
}
