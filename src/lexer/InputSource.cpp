/***
 * Name: nestport::lex::InputSource, StringInput, FileInput
 * Purpose: Line readers feeding the Lexer.
 */
#include "lexer/InputSource.h"
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include <fstream>
#include <ios>
#include <sstream>
#include <utility>

namespace nestport::lex {

InputSource::InputSource(std::string name, std::unique_ptr<std::istream> in)
  : name_(std::move(name)), in_(std::move(in)) {}

bool InputSource::readLine(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  if (!out.empty() && out.back() == '\r') { out.pop_back(); }
  ++lineNo_;
  return true;
}

StringInput::StringInput(std::string text, std::string name)
  : InputSource(std::move(name), std::make_unique<std::istringstream>(std::move(text))) {}

FileInput::FileInput(const std::string& path)
  : InputSource(path, std::make_unique<std::ifstream>(path, std::ios::binary)) {}

// Before the first readLine the stream state only reflects the open
bool FileInput::isOpen() const { return good(); }

} // namespace nestport::lex
