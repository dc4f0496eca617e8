#include "LineReverser.hpp"
#include "LineUtils.hpp"
#include "ReadError.hpp"
#include <algorithm>
#include <string_view>
#include <trantor/utils/Logger.h>

namespace {
// Initial capacity for the per-chunk line list; grows as needed.
constexpr std::size_t kInitialLineCapacity = 1000;
}

LineReverser::LineReverser(int fd, std::size_t chunkSize, std::size_t maxLineLength)
    : reader_(fd, chunkSize),
      maxLineLength_(maxLineLength) {
    batch_.reserve(kInitialLineCapacity);
}

bool LineReverser::advance() {
    batch_.clear();
    if (state_ == State::DoneClean || state_ == State::DoneError) {
        return false;
    }
    if (lastError_) {
        // The previous chunk stopped on a splitting error; its lines went out already.
        finish(lastError_);
        return false;
    }

    chunk_.resize(reader_.chunkSize());
    std::error_code ec;
    std::size_t n = reader_.read(chunk_.data(), chunk_.size(), ec);
    if (ec) {
        finish(ec);
        return false;
    }
    state_ = State::Advancing;
    extractLines(n);
    return true;
}

std::vector<std::string> LineReverser::takeLines() {
    std::vector<std::string> out;
    out.swap(batch_);
    return out;
}

std::error_code LineReverser::error() const {
    if (lastError_ == ReadErrc::EndOfData) {
        return {};
    }
    return lastError_;
}

void LineReverser::extractLines(std::size_t count) {
    // The held-back first line of the later chunk continues this chunk's last line.
    chunk_.resize(count);
    chunk_.insert(chunk_.end(), pending_.begin(), pending_.end());
    pending_.clear();

    std::vector<std::string_view> views;
    views.reserve(kInitialLineCapacity);
    if (!split_lines(chunk_.data(), chunk_.size(), maxLineLength_, views)) {
        lastError_ = ReadErrc::LineTooLong;
        LOG_ERROR << "Line longer than " << maxLineLength_ << " bytes in chunk at offset "
                  << reader_.nextOffset() + static_cast<int64_t>(reader_.chunkSize())
                  << ", keeping " << views.size() << " lines";
    }

    // Only the chunk at offset 0 is known to start on a line boundary.
    if (!reader_.exhausted() && !views.empty()) {
        if (views.front().empty()) {
            // The chunk starts right at a newline: keep the newline so the earlier
            // chunk's last line stays a separate line once the suffix is appended.
            pending_.assign(1, '\n');
        } else {
            pending_.assign(views.front().data(), views.front().size());
        }
        views.erase(views.begin());
    }

    batch_.reserve(views.size());
    for (auto it = views.rbegin(); it != views.rend(); ++it) {
        batch_.emplace_back(drop_cr(*it));
    }
}

void LineReverser::finish(std::error_code ec) {
    lastError_ = ec;
    state_ = ec == ReadErrc::EndOfData ? State::DoneClean : State::DoneError;
    pending_.clear();
    if (state_ == State::DoneError) {
        LOG_ERROR << "Reverse read stopped: " << ec.message();
    } else {
        LOG_TRACE << "Reverse read complete after " << reader_.readCount() << " chunks";
    }
}
