#pragma once

#include "core/FileState.hpp"

namespace hashflow {

/**
 * @brief Output endpoint of one file pipeline
 *
 * send() may block while the receiver is backed up. It returns false once
 * nobody is listening any more, which the pipeline treats as cancellation.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual bool send(const FileState& state) = 0;
};

}
