#include "jsxgrammar.hpp"

#include <cctype>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace Kalkan::Core {

namespace {

bool isIdentifierStart(char c)
{
    const auto byte = static_cast<unsigned char>(c);
    return std::isalpha(byte) || c == '_' || c == '$' || byte >= 0x80;
}

bool isIdentifierPart(char c)
{
    return isIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool isJsxNamePart(char c)
{
    return isIdentifierPart(c) || c == '-' || c == ':' || c == '.';
}

// Keywords after which an expression, and therefore a regex or JSX, may start
const std::unordered_set<std::string>& expressionKeywords()
{
    static const std::unordered_set<std::string> keywords = {
        "return", "typeof", "instanceof", "in", "of", "new", "delete", "void", "throw",
        "case", "do", "else", "yield", "await", "extends", "default",
    };
    return keywords;
}

std::string trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::string();
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

class Parser {
public:
    Parser(const std::string& source, GrammarMode mode, const CancellationToken& token)
        : src_(source), mode_(mode), token_(token) {}

    std::unique_ptr<SyntaxNode> parseProgram()
    {
        auto program = makeNode("Program");

        if (startsWith("#!")) {
            if (mode_ == GrammarMode::Strict) {
                fail("Hashbang is not allowed in strict mode", true);
            }
            while (!atEnd() && peek() != '\n') {
                advance();
            }
        }

        parseSequence(*program, '\0');
        return program;
    }

private:
    struct NestingScope {
        Parser& parser;
        explicit NestingScope(Parser& p) : parser(p)
        {
            if (++parser.nesting_ > JsxGrammar::kMaxNesting) {
                parser.fail("Nesting exceeds " + std::to_string(JsxGrammar::kMaxNesting) + " levels");
            }
        }
        ~NestingScope() { --parser.nesting_; }
    };

    const std::string& src_;
    GrammarMode mode_;
    const CancellationToken& token_;

    std::size_t pos_ = 0;
    std::uint32_t line_ = 1;
    std::uint32_t column_ = 1;
    std::uint32_t steps_ = 0;
    int nesting_ = 0;
    bool expectExpression_ = true;
    std::vector<std::string> openElements_;

    bool atEnd() const { return pos_ >= src_.size(); }

    char peek(std::size_t ahead = 0) const
    {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    bool startsWith(std::string_view text) const
    {
        return src_.compare(pos_, text.size(), text) == 0;
    }

    void advance()
    {
        if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    void advance(std::size_t count)
    {
        while (count-- > 0 && !atEnd()) {
            advance();
        }
    }

    void tick()
    {
        if ((++steps_ & 0x3FF) == 0 && token_.isCancelled()) {
            throw ParseCancelled();
        }
    }

    [[noreturn]] void fail(const std::string& message, bool recoverable = false) const
    {
        throw GrammarError(message, recoverable, line_, column_);
    }

    std::unique_ptr<SyntaxNode> makeNode(const char* kind) const
    {
        return std::make_unique<SyntaxNode>(kind, line_, column_);
    }

    void skipTrivia()
    {
        while (!atEnd()) {
            tick();
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (!atEnd() && peek() != '\n') {
                    advance();
                }
            } else if (c == '/' && peek(1) == '*') {
                advance(2);
                while (!startsWith("*/")) {
                    if (atEnd()) {
                        fail("Unterminated comment");
                    }
                    tick();
                    advance();
                }
                advance(2);
            } else {
                return;
            }
        }
    }

    void skipHtmlComment()
    {
        if (mode_ == GrammarMode::Strict) {
            fail("HTML-style comments are not allowed in strict mode", true);
        }
        const auto end = src_.find("-->", pos_);
        if (end != std::string::npos) {
            advance(end + 3 - pos_);
        } else {
            while (!atEnd() && peek() != '\n') {
                advance();
            }
        }
    }

    void parseSequence(SyntaxNode& parent, char closing)
    {
        for (;;) {
            tick();
            skipTrivia();
            if (atEnd()) {
                if (closing != '\0') {
                    fail(std::string("Unexpected end of input, expected '") + closing + "'");
                }
                return;
            }

            const char c = peek();
            if (closing != '\0' && c == closing) {
                advance();
                expectExpression_ = false;
                return;
            }

            switch (c) {
            case ')':
            case ']':
            case '}':
                fail(std::string("Unexpected '") + c + "'");
            case '{':
                parseBracketed(parent, "Block", '}');
                break;
            case '(':
                parseBracketed(parent, "Group", ')');
                break;
            case '[':
                parseBracketed(parent, "Array", ']');
                break;
            case '\'':
            case '"':
                parent.addChild(parseString(c));
                expectExpression_ = false;
                break;
            case '`':
                parent.addChild(parseTemplate());
                expectExpression_ = false;
                break;
            case '/':
                if (expectExpression_) {
                    parent.addChild(parseRegExp());
                    expectExpression_ = false;
                } else {
                    advance();
                    expectExpression_ = true;
                }
                break;
            case '<':
                if (startsWith("<!--")) {
                    skipHtmlComment();
                } else if (expectExpression_ && (isIdentifierStart(peek(1)) || peek(1) == '>')) {
                    parent.addChild(parseJsxElement());
                    expectExpression_ = false;
                } else {
                    advance();
                    expectExpression_ = true;
                }
                break;
            case '+':
            case '-':
                // ++ and -- leave the expression state as it was
                if (peek(1) == c) {
                    advance(2);
                } else {
                    advance();
                    expectExpression_ = true;
                }
                break;
            default:
                if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
                    parent.addChild(parseNumber());
                    expectExpression_ = false;
                } else if (isIdentifierStart(c) || c == '#') {
                    auto identifier = parseIdentifier();
                    expectExpression_ = expressionKeywords().count(identifier->name) != 0;
                    parent.addChild(std::move(identifier));
                } else {
                    advance();
                    expectExpression_ = true;
                }
                break;
            }
        }
    }

    void parseBracketed(SyntaxNode& parent, const char* kind, char closing)
    {
        NestingScope scope(*this);
        SyntaxNode* node = parent.addChild(makeNode(kind));
        advance();
        expectExpression_ = true;
        parseSequence(*node, closing);
    }

    std::unique_ptr<SyntaxNode> parseIdentifier()
    {
        auto node = makeNode("Identifier");
        const std::size_t start = pos_;
        advance();
        while (!atEnd() && isIdentifierPart(peek())) {
            advance();
        }
        node->name = src_.substr(start, pos_ - start);
        return node;
    }

    std::unique_ptr<SyntaxNode> parseNumber()
    {
        auto node = makeNode("NumericLiteral");
        const std::size_t start = pos_;
        const bool hex = startsWith("0x") || startsWith("0X");
        while (!atEnd()) {
            const char c = peek();
            const char previous = pos_ > start ? src_[pos_ - 1] : '\0';
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_') {
                advance();
            } else if ((c == '+' || c == '-') && !hex && (previous == 'e' || previous == 'E')) {
                advance();
            } else {
                break;
            }
        }
        node->value = src_.substr(start, pos_ - start);
        return node;
    }

    std::unique_ptr<SyntaxNode> parseString(char quote)
    {
        auto node = makeNode("StringLiteral");
        advance();
        const std::size_t start = pos_;
        for (;;) {
            tick();
            if (atEnd() || peek() == '\n') {
                fail("Unterminated string literal");
            }
            const char c = peek();
            if (c == quote) {
                break;
            }
            if (c == '\\') {
                advance();
                if (atEnd()) {
                    fail("Unterminated string literal");
                }
            }
            advance();
        }
        node->value = src_.substr(start, pos_ - start);
        advance();
        return node;
    }

    std::unique_ptr<SyntaxNode> parseTemplate()
    {
        NestingScope scope(*this);
        auto node = makeNode("TemplateLiteral");
        advance();
        std::string text;
        for (;;) {
            tick();
            if (atEnd()) {
                fail("Unterminated template literal");
            }
            const char c = peek();
            if (c == '`') {
                advance();
                break;
            }
            if (c == '\\') {
                text += c;
                advance();
                if (!atEnd()) {
                    text += peek();
                    advance();
                }
                continue;
            }
            if (c == '$' && peek(1) == '{') {
                SyntaxNode* expression = node->addChild(makeNode("TemplateExpression"));
                advance(2);
                expectExpression_ = true;
                parseSequence(*expression, '}');
                continue;
            }
            text += c;
            advance();
        }
        node->value = text;
        return node;
    }

    std::unique_ptr<SyntaxNode> parseRegExp()
    {
        auto node = makeNode("RegExpLiteral");
        const std::size_t start = pos_;
        advance();
        bool inClass = false;
        for (;;) {
            tick();
            if (atEnd() || peek() == '\n') {
                fail("Unterminated regular expression");
            }
            const char c = peek();
            if (c == '\\') {
                advance();
                if (atEnd() || peek() == '\n') {
                    fail("Unterminated regular expression");
                }
            } else if (c == '[') {
                inClass = true;
            } else if (c == ']') {
                inClass = false;
            } else if (c == '/' && !inClass) {
                advance();
                break;
            }
            advance();
        }
        while (!atEnd() && isIdentifierPart(peek())) {
            advance();
        }
        node->value = src_.substr(start, pos_ - start);
        return node;
    }

    std::string readJsxName()
    {
        const std::size_t start = pos_;
        while (!atEnd() && isJsxNamePart(peek())) {
            advance();
        }
        return src_.substr(start, pos_ - start);
    }

    std::unique_ptr<SyntaxNode> parseJsxElement()
    {
        NestingScope scope(*this);
        auto node = makeNode("JSXElement");
        advance();

        if (peek() == '>') {
            node->kind = "JSXFragment";
            advance();
            parseJsxChildren(*node, std::string());
            return node;
        }

        node->name = readJsxName();
        if (node->name.empty()) {
            fail("Expected JSX element name");
        }

        if (!parseJsxAttributes(*node)) {
            parseJsxChildren(*node, node->name);
        }
        return node;
    }

    // Returns true for a self-closing element
    bool parseJsxAttributes(SyntaxNode& element)
    {
        for (;;) {
            tick();
            skipTrivia();
            if (atEnd()) {
                fail("Unterminated JSX opening element <" + element.name + ">");
            }

            const char c = peek();
            if (c == '/') {
                if (peek(1) != '>') {
                    fail("Expected '>' after '/' in JSX element <" + element.name + ">");
                }
                advance(2);
                return true;
            }
            if (c == '>') {
                advance();
                return false;
            }

            if (c == '{') {
                NestingScope scope(*this);
                auto spread = makeNode("JSXSpreadAttribute");
                advance();
                skipTrivia();
                if (!startsWith("...")) {
                    fail("Expected '...' in JSX spread attribute");
                }
                advance(3);
                expectExpression_ = true;
                parseSequence(*spread, '}');
                element.addChild(std::move(spread));
                continue;
            }

            if (!isIdentifierStart(c)) {
                fail(std::string("Unexpected character '") + c + "' in JSX element <" + element.name + ">");
            }

            auto attribute = makeNode("JSXAttribute");
            attribute->name = readJsxName();
            skipTrivia();
            if (peek() == '=') {
                advance();
                skipTrivia();
                const char v = peek();
                if (v == '"' || v == '\'') {
                    attribute->addChild(parseJsxString(v));
                } else if (v == '{') {
                    attribute->addChild(parseExpressionContainer());
                } else if (v == '<') {
                    attribute->addChild(parseJsxElement());
                } else {
                    fail("Expected a value for JSX attribute '" + attribute->name + "'");
                }
            }
            element.addChild(std::move(attribute));
        }
    }

    std::unique_ptr<SyntaxNode> parseJsxString(char quote)
    {
        auto node = makeNode("StringLiteral");
        advance();
        const std::size_t start = pos_;
        while (atEnd() || peek() != quote) {
            if (atEnd()) {
                fail("Unterminated JSX attribute string");
            }
            tick();
            advance();
        }
        node->value = src_.substr(start, pos_ - start);
        advance();
        return node;
    }

    std::unique_ptr<SyntaxNode> parseExpressionContainer()
    {
        NestingScope scope(*this);
        auto node = makeNode("JSXExpressionContainer");
        advance();
        expectExpression_ = true;
        parseSequence(*node, '}');
        return node;
    }

    void parseJsxChildren(SyntaxNode& element, const std::string& name)
    {
        openElements_.push_back(name);

        for (;;) {
            tick();
            if (atEnd()) {
                fail("Unterminated JSX element <" + name + ">");
            }

            const char c = peek();
            if (c == '<' && peek(1) == '/') {
                const std::size_t savedPos = pos_;
                const std::uint32_t savedLine = line_;
                const std::uint32_t savedColumn = column_;

                advance(2);
                skipTrivia();
                const std::string closing = readJsxName();
                skipTrivia();
                if (peek() != '>') {
                    fail("Expected '>' in JSX closing tag </" + closing + ">");
                }
                advance();

                if (closing == name) {
                    openElements_.pop_back();
                    expectExpression_ = false;
                    return;
                }

                if (mode_ == GrammarMode::Strict) {
                    fail("Expected corresponding JSX closing tag for <" + name + ">", true);
                }

                // Permissive: a closing tag for an enclosing element closes this one
                for (std::size_t i = 0; i + 1 < openElements_.size(); ++i) {
                    if (openElements_[i] == closing) {
                        pos_ = savedPos;
                        line_ = savedLine;
                        column_ = savedColumn;
                        openElements_.pop_back();
                        return;
                    }
                }
                continue;
            }

            if (c == '<') {
                if (startsWith("<!--")) {
                    skipHtmlComment();
                } else {
                    element.addChild(parseJsxElement());
                }
                continue;
            }

            if (c == '{') {
                element.addChild(parseExpressionContainer());
                continue;
            }

            auto text = makeNode("JSXText");
            const std::size_t start = pos_;
            while (!atEnd() && peek() != '<' && peek() != '{') {
                tick();
                advance();
            }
            text->value = trim(std::string_view(src_).substr(start, pos_ - start));
            if (!text->value.empty()) {
                element.addChild(std::move(text));
            }
        }
    }
};

} // namespace

std::unique_ptr<SyntaxNode> JsxGrammar::parse(const std::string& source,
                                              GrammarMode mode,
                                              const CancellationToken& token) const
{
    if (token.isCancelled()) {
        throw ParseCancelled();
    }

    Parser parser(source, mode, token);
    return parser.parseProgram();
}

} // namespace Kalkan::Core
