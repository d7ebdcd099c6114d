/**
 * Name: nestport::lex::InputSource
 * Purpose: Line-oriented input with a display name and a 1-based line counter.
 *   Subclasses only supply the stream; readLine strips a trailing '\r' so
 *   CRLF sources lex exactly like LF ones.
 */
#pragma once

#include <istream>
#include <memory>
#include <string>

namespace nestport::lex {

class InputSource {
public:
    virtual ~InputSource() = default;
    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;

    // Next line without its terminator; false at end of input
    bool readLine(std::string& out);

    const std::string& name() const { return name_; }
    int lineNo() const { return lineNo_; }

protected:
    InputSource(std::string name, std::unique_ptr<std::istream> in);
    bool good() const { return in_ && in_->good(); }

private:
    std::string name_{};
    std::unique_ptr<std::istream> in_{nullptr};
    int lineNo_{0};
};

} // namespace nestport::lex
