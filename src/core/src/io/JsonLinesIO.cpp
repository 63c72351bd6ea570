/**
 * @file JsonLinesIO.cpp
 * @brief Line-delimited JSON I/O implementation
 */

#include "JsonLinesIO.hpp"
#include "../logging/Logger.hpp"
#include <nlohmann/json.hpp>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace arm_teleop {
namespace io {

using json = nlohmann::json;

namespace {

LineStatus waitReadable(int fd, std::chrono::milliseconds wait) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (rc > 0) {
        // POLLHUP/POLLERR: let the stream read report end of input
        return LineStatus::LINE;
    }
    if (rc == 0) {
        return LineStatus::TIMEOUT;
    }
    if (errno == EINTR) {
        return LineStatus::INTERRUPTED;
    }
    LOG_ERROR("poll() on input fd {} failed: {}", fd, std::strerror(errno));
    return LineStatus::END;
}

} // anonymous namespace

LineStatus readLine(std::istream& in, int fd, std::chrono::milliseconds wait, std::string& line) {
    while (true) {
        if (fd >= 0 && in.rdbuf()->in_avail() == 0) {
            LineStatus ready = waitReadable(fd, wait);
            if (ready != LineStatus::LINE) {
                return ready;
            }
        }
        if (!std::getline(in, line)) {
            return LineStatus::END;
        }
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            return LineStatus::LINE;
        }
    }
}

// ============================================================================
// Controller input
// ============================================================================

JsonLinesControllerInput::JsonLinesControllerInput(std::istream& in, int fd,
                                                   std::chrono::milliseconds wait)
    : in_(in)
    , fd_(fd)
    , wait_(wait)
{
}

bool JsonLinesControllerInput::poll(teleop::ControllerAxes& axes) {
    timedOut_ = false;
    if (eof_) {
        return false;
    }

    std::string line;
    switch (readLine(in_, fd_, wait_, line)) {
        case LineStatus::LINE:
            break;
        case LineStatus::END:
            eof_ = true;
            LOG_INFO("Controller input exhausted after {} lines", lines_);
            return false;
        case LineStatus::TIMEOUT:
            timedOut_ = true;
            return false;
        case LineStatus::INTERRUPTED:
            LOG_DEBUG("Controller wait interrupted by signal");
            return false;
    }
    ++lines_;

    try {
        json j = json::parse(line);
        if (!j.is_object()) {
            LOG_WARN("Controller line {} is not a JSON object", lines_);
            return false;
        }
        teleop::ControllerAxes parsed;
        parsed.leftX = j.value("lx", 0.0);
        parsed.leftY = j.value("ly", 0.0);
        parsed.rightX = j.value("rx", 0.0);
        parsed.rightY = j.value("ry", 0.0);
        parsed.gripper = j.value("gripper", -1.0);
        axes = parsed;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Controller line {} rejected: {}", lines_, e.what());
        return false;
    }
}

// ============================================================================
// Observation source
// ============================================================================

JsonLinesJointStateSource::JsonLinesJointStateSource(std::istream& in, int fd,
                                                     std::chrono::milliseconds wait)
    : in_(in)
    , fd_(fd)
    , wait_(wait)
{
}

std::optional<joints::JointValueMap> JsonLinesJointStateSource::readObservation() {
    timedOut_ = false;
    if (eof_) {
        return std::nullopt;
    }

    std::string line;
    switch (readLine(in_, fd_, wait_, line)) {
        case LineStatus::LINE:
            break;
        case LineStatus::END:
            eof_ = true;
            return std::nullopt;
        case LineStatus::TIMEOUT:
            timedOut_ = true;
            return std::nullopt;
        case LineStatus::INTERRUPTED:
            LOG_DEBUG("Observation wait interrupted by signal");
            return std::nullopt;
    }

    try {
        json j = json::parse(line);
        joints::JointValueMap observation;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_number()) {
                observation[it.key()] = it.value().get<double>();
            }
        }
        return observation;
    } catch (const json::exception& e) {
        LOG_WARN("Observation line rejected: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Command sink
// ============================================================================

JsonLinesCommandSink::JsonLinesCommandSink(std::ostream& out)
    : out_(out)
{
}

bool JsonLinesCommandSink::sendCommand(const joints::JointValueMap& command) {
    json j;
    j["cycle"] = cycle_;
    j["action"] = command;

    out_ << j.dump() << '\n';
    out_.flush();
    if (!out_.good()) {
        LOG_ERROR("Command stream write failed at cycle {}", cycle_);
        return false;
    }
    ++cycle_;
    return true;
}

} // namespace io
} // namespace arm_teleop
