#include "syntaxnode.hpp"

#include <QJsonArray>

namespace Kalkan::Core {

QJsonObject SyntaxNode::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("type"), QString::fromStdString(kind));
    if (!name.empty()) {
        object.insert(QStringLiteral("name"), QString::fromStdString(name));
    }
    if (!value.empty()) {
        object.insert(QStringLiteral("value"), QString::fromStdString(value));
    }
    object.insert(QStringLiteral("line"), static_cast<int>(line));
    object.insert(QStringLiteral("column"), static_cast<int>(column));

    if (!children.empty()) {
        QJsonArray array;
        for (const auto& child : children) {
            array.append(child->toJson());
        }
        object.insert(QStringLiteral("children"), array);
    }
    return object;
}

} // namespace Kalkan::Core
