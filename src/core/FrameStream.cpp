/**
 * FrameStream.cpp - Scoped open/close of the audio input
 */

#include "parley/core/FrameStream.hpp"

#include <exception>
#include <iostream>

namespace parley::core {

ScopedFrameStream::ScopedFrameStream(AudioFrameSource* source, const char* tag)
    : source_(source)
    , tag_(tag)
{
    if (!source_) {
        std::cout << "[" << tag_ << "] No audio input available" << std::endl;
        return;
    }

    try {
        open_ = source_->open();
    } catch (const std::exception& e) {
        std::cerr << "[" << tag_ << "] Audio input failed to open: " << e.what() << std::endl;
        open_ = false;
        return;
    }

    if (!open_) {
        std::cerr << "[" << tag_ << "] Audio input unavailable" << std::endl;
    }
}

ScopedFrameStream::~ScopedFrameStream() {
    close();
}

void ScopedFrameStream::close() {
    if (!open_) return;
    open_ = false;

    try {
        source_->close();
    } catch (const std::exception& e) {
        std::cerr << "[" << tag_ << "] Audio input failed to close: " << e.what() << std::endl;
    }
}

} // namespace parley::core
