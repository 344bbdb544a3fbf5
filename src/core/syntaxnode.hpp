#ifndef SYNTAXNODE_HPP
#define SYNTAXNODE_HPP

#include <QJsonObject>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Kalkan::Core {

/**
 * @brief Node of a parsed syntax tree
 *
 * `kind` is the discriminating field (e.g. "JSXElement", "Identifier").
 * `name` holds identifiers, element and attribute names; `value` holds
 * literal text.
 */
struct SyntaxNode {
    std::string kind;
    std::string name;
    std::string value;
    std::uint32_t line = 0;
    std::uint32_t column = 0;
    std::vector<std::unique_ptr<SyntaxNode>> children;

    SyntaxNode() = default;
    SyntaxNode(std::string k, std::uint32_t l, std::uint32_t c)
        : kind(std::move(k)), line(l), column(c) {}

    SyntaxNode* addChild(std::unique_ptr<SyntaxNode> child)
    {
        children.push_back(std::move(child));
        return children.back().get();
    }

    /**
     * @brief Serializes the subtree; nodes carry a "type" key like ESTree output
     */
    QJsonObject toJson() const;
};

/**
 * @brief Shape of a validated tree
 */
struct TreeStats {
    std::uint64_t nodeCount = 0;
    int maxDepth = 0;
};

} // namespace Kalkan::Core

#endif // SYNTAXNODE_HPP
