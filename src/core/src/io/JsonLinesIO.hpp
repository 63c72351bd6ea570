/**
 * @file JsonLinesIO.hpp
 * @brief Line-delimited JSON controller input, observation source and command sink
 *
 * Controller line:   {"lx": 0.0, "ly": 0.5, "rx": 0.0, "ry": 0.0, "gripper": -1.0}
 * Observation line:  {"shoulder_pan.pos": 1.5, ..., "gripper.pos": 40.0}
 * Command line:      {"cycle": 12, "action": {"shoulder_pan.pos": 1.5, ...}}
 *
 * Readers given a file descriptor wait at most `wait` for it to become
 * readable before each line, so a silent producer cannot stall a cycle and
 * a signal interrupts the wait.
 */

#pragma once

#include "IControllerInput.hpp"
#include "IJointCommandSink.hpp"
#include "IJointStateSource.hpp"
#include <chrono>
#include <istream>
#include <ostream>
#include <string>

namespace arm_teleop {
namespace io {

enum class LineStatus {
    LINE,
    END,
    TIMEOUT,
    INTERRUPTED
};

/**
 * Next non-blank line from `in`. With fd >= 0 and nothing buffered in the
 * stream, first waits up to `wait` for the descriptor to become readable.
 */
LineStatus readLine(std::istream& in, int fd, std::chrono::milliseconds wait, std::string& line);

class JsonLinesControllerInput : public IControllerInput {
public:
    explicit JsonLinesControllerInput(std::istream& in, int fd = -1,
                                      std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /**
     * Consume one line. Blank lines are skipped; a malformed line returns
     * false for this cycle.
     */
    bool poll(teleop::ControllerAxes& axes) override;
    bool endOfStream() const override { return eof_; }
    bool timedOut() const override { return timedOut_; }
    std::string getInputName() const override { return "JsonLinesControllerInput"; }

    int linesRead() const { return lines_; }

private:
    std::istream& in_;
    int fd_;
    std::chrono::milliseconds wait_;
    bool eof_ = false;
    bool timedOut_ = false;
    int lines_ = 0;
};

class JsonLinesJointStateSource : public IJointStateSource {
public:
    explicit JsonLinesJointStateSource(std::istream& in, int fd = -1,
                                       std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    std::optional<joints::JointValueMap> readObservation() override;
    bool endOfStream() const override { return eof_; }
    bool timedOut() const override { return timedOut_; }
    std::string getSourceName() const override { return "JsonLinesJointStateSource"; }

private:
    std::istream& in_;
    int fd_;
    std::chrono::milliseconds wait_;
    bool eof_ = false;
    bool timedOut_ = false;
};

class JsonLinesCommandSink : public IJointCommandSink {
public:
    explicit JsonLinesCommandSink(std::ostream& out);

    bool sendCommand(const joints::JointValueMap& command) override;
    std::string getSinkName() const override { return "JsonLinesCommandSink"; }

    int commandsWritten() const { return cycle_; }

private:
    std::ostream& out_;
    int cycle_ = 0;
};

} // namespace io
} // namespace arm_teleop
