#ifndef JSXGRAMMAR_HPP
#define JSXGRAMMAR_HPP

#include "sourcegrammar.hpp"

namespace Kalkan::Core {

/**
 * @brief Structural parser for JavaScript, TypeScript and JSX sources
 *
 * Recognizes literals, identifiers, bracketed groups and full JSX element
 * structure; operators are consumed without producing nodes. Strict mode
 * rejects a hashbang line, HTML-style comments and mismatched closing
 * tags. Permissive mode accepts all three.
 */
class JsxGrammar : public SourceGrammar {
public:
    static constexpr int kMaxNesting = 512;

    std::unique_ptr<SyntaxNode> parse(const std::string& source,
                                      GrammarMode mode,
                                      const CancellationToken& token) const override;

    std::string name() const override { return "jsx"; }
};

} // namespace Kalkan::Core

#endif // JSXGRAMMAR_HPP
