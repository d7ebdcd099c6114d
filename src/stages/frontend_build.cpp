/***
 * Name: nestport::stages::Frontend::Build
 * Purpose: Lex, group and parse one source and record geometry and timing.
 * Inputs:
 *   - src: source text
 *   - name: file name stamped on every token
 *   - token_log: optional sink for --log-tokens
 * Outputs:
 *   - File AST; LexError, UnbalancedBracketError or a parse error on failure
 * Theory of Operation: Timers are scoped per phase so a failing phase still
 *   records its duration.
 */
#include "nestport/stages/frontend.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "ast/GeometrySummary.h"
#include "grouping/TokenGrouper.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

namespace nestport::stages {

static void LogTokens(const std::vector<lex::Token>& tokens, std::ostream& out) {
  for (const auto& tok : tokens) {
    out << tok.file << ":" << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind);
    if (!tok.text.empty()) {
      out << " '" << tok.text << "'";
    }
    out << '\n';
  }
}

auto Frontend::Build(const std::string& src, const std::string& name, std::ostream* token_log)
    -> std::unique_ptr<ast::File> {
  lex::Lexer lexer;
  lexer.pushString(src, name);
  std::vector<lex::Token> tokens;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Lex);
    tokens = lexer.tokens();
  }
  metrics::Metrics::AddTokens(tokens.size());
  if (token_log != nullptr) {
    LogTokens(tokens, *token_log);
  }

  group::TokenGroup root;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Group);
    root = group::TokenGrouper::group(tokens);
  }

  std::unique_ptr<ast::File> file;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
    file = parse::Parser(root).parseFile();
  }
  metrics::Metrics::AddASTGeometry(ast::ComputeGeometry(*file));
  return file;
}

}  // namespace nestport::stages
