#include <codekata/lang/parser.hpp>

#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/ast.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/lexer.hpp>
#include <codekata/lang/token.hpp>
#include <codekata/lang/value.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/any_of.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace codekata::lang {

namespace {

using NodeResult = Expected<NodePtr, Fault>;

class NestingGuard
{
public:
    explicit NestingGuard(std::size_t& depth)
        : depth_{++depth} {}

    ~NestingGuard() { --depth_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::size_t& depth_;
};

std::string describe_token(const Token& tok) {
    switch (tok.kind) {
    case TokenKind::EndOfInput:
        return "end of input";
    case TokenKind::Separator:
        return tok.text == ";" ? "';'" : "newline";
    case TokenKind::String:
        return fmt::format("string \"{}\"", tok.text);
    case TokenKind::Atom:
        return fmt::format("atom :{}", tok.text);
    default:
        return fmt::format("'{}'", tok.text);
    }
}

class Parser
{
public:
    explicit Parser(const std::vector<Token>& tokens)
        : tokens_{tokens} {
        DEBUG_ASSERT(!tokens_.empty() && tokens_.back().kind == TokenKind::EndOfInput);
    }

    Expected<Program, Fault> parse_program() {
        auto body = TRY(statements({TokenKind::EndOfInput}));
        return Program{std::move(body)};
    }

private:
    const Token& peek(std::size_t ahead = 0) const {
        return tokens_[std::min(cursor_ + ahead, tokens_.size() - 1)];
    }

    const Token& advance() {
        const Token& tok = peek();
        if (cursor_ < tokens_.size() - 1) {
            ++cursor_;
        }
        return tok;
    }

    bool check(TokenKind kind) const { return peek().kind == kind; }

    bool match(TokenKind kind) {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    void skip_separators() {
        while (check(TokenKind::Separator)) {
            advance();
        }
    }

    Fault error_here(std::string_view expected) const {
        return {FaultKind::Syntax, fmt::format("expected {}, got {}", expected, describe_token(peek())),
                peek().pos.line};
    }

    Expected<Token, Fault> expect(TokenKind kind, std::string_view what) {
        if (!check(kind)) {
            return error_here(what);
        }
        return advance();
    }

    static std::shared_ptr<Node> make_node(NodeKind kind, SourcePos pos) {
        auto node = std::make_shared<Node>();
        node->kind = kind;
        node->pos = pos;
        return node;
    }

    /// Finalizes a node: computes its height and enforces the nesting limit
    static NodeResult seal(std::shared_ptr<Node> node) {
        std::size_t tallest = 0;
        for (const auto& child : node->children) {
            tallest = std::max(tallest, child->height);
        }
        node->height = tallest + 1;

        if (node->height > MAX_NESTING_DEPTH) {
            return Fault{FaultKind::Syntax, fmt::format("expression nested too deeply (limit {})", MAX_NESTING_DEPTH),
                         node->pos.line};
        }

        return NodePtr{std::move(node)};
    }

    bool at_any(std::initializer_list<TokenKind> kinds) const {
        return ranges::any_of(kinds, [this](TokenKind kind) { return check(kind); });
    }

    Expected<std::vector<NodePtr>, Fault> statements(std::initializer_list<TokenKind> terminators) {
        std::vector<NodePtr> result;

        skip_separators();

        while (!at_any(terminators)) {
            if (check(TokenKind::EndOfInput)) {
                return error_here("'end'");
            }

            result.push_back(TRY(statement()));

            if (check(TokenKind::Separator)) {
                skip_separators();
            } else if (!at_any(terminators)) {
                return error_here("newline or ';'");
            }
        }

        return result;
    }

    NodeResult block(std::initializer_list<TokenKind> terminators) {
        auto node = make_node(NodeKind::Block, peek().pos);
        node->children = TRY(statements(terminators));
        return seal(std::move(node));
    }

    NodeResult statement() {
        if (check(TokenKind::KwDef)) {
            return function_def();
        }
        return expression();
    }

    NodeResult function_def() {
        auto node = make_node(NodeKind::FunctionDef, advance().pos);

        node->name = TRY(expect(TokenKind::Identifier, "function name")).text;
        TRY(expect(TokenKind::LParen, "'('"));
        node->params = TRY(parameters(TokenKind::RParen));
        TRY(expect(TokenKind::KwDo, "'do'"));
        node->children.push_back(TRY(block({TokenKind::KwEnd})));
        TRY(expect(TokenKind::KwEnd, "'end'"));

        return seal(std::move(node));
    }

    Expected<std::vector<std::string>, Fault> parameters(TokenKind close) {
        std::vector<std::string> params;

        skip_separators();
        if (match(close)) {
            return params;
        }

        while (true) {
            params.push_back(TRY(expect(TokenKind::Identifier, "parameter name")).text);
            skip_separators();

            if (match(TokenKind::Comma)) {
                skip_separators();
                continue;
            }

            TRY(expect(close, close == TokenKind::Arrow ? "'->'" : "')'"));
            return params;
        }
    }

    Expected<std::vector<NodePtr>, Fault> arguments(TokenKind close, std::string_view close_text) {
        std::vector<NodePtr> args;

        skip_separators();
        if (match(close)) {
            return args;
        }

        while (true) {
            args.push_back(TRY(expression()));
            skip_separators();

            if (match(TokenKind::Comma)) {
                skip_separators();
                continue;
            }

            TRY(expect(close, close_text));
            return args;
        }
    }

    Fault too_deep() const {
        return {FaultKind::Syntax, fmt::format("expression nested too deeply (limit {})", MAX_NESTING_DEPTH),
                peek().pos.line};
    }

    NodeResult expression() {
        NestingGuard guard{depth_};
        if (depth_ > MAX_NESTING_DEPTH) {
            return too_deep();
        }

        if (check(TokenKind::Identifier) && peek(1).kind == TokenKind::Assign) {
            auto node = make_node(NodeKind::Assign, peek().pos);
            node->name = advance().text;
            advance(); // '='
            skip_separators();
            node->children.push_back(TRY(expression()));
            return seal(std::move(node));
        }

        return or_expr();
    }

    template <typename Next>
    NodeResult binary_chain(Next next, NodeKind kind, std::initializer_list<std::pair<TokenKind, TokenKind>> ops) {
        NodePtr lhs = TRY((this->*next)());

        while (true) {
            const auto* found = std::find_if(ops.begin(), ops.end(), [this](const auto& op) { return check(op.first); });
            if (found == ops.end()) {
                return lhs;
            }

            auto node = make_node(kind, advance().pos);
            node->op = found->second;
            skip_separators();

            NodePtr rhs = TRY((this->*next)());
            node->children = {std::move(lhs), std::move(rhs)};
            lhs = TRY(seal(std::move(node)));
        }
    }

    NodeResult or_expr() {
        return binary_chain(&Parser::and_expr, NodeKind::Logical,
                            {{TokenKind::KwOr, TokenKind::OrOr}, {TokenKind::OrOr, TokenKind::OrOr}});
    }

    NodeResult and_expr() {
        return binary_chain(&Parser::not_expr, NodeKind::Logical,
                            {{TokenKind::KwAnd, TokenKind::AndAnd}, {TokenKind::AndAnd, TokenKind::AndAnd}});
    }

    NodeResult not_expr() {
        NestingGuard guard{depth_};
        if (depth_ > MAX_NESTING_DEPTH) {
            return too_deep();
        }

        if (check(TokenKind::KwNot) || check(TokenKind::Bang)) {
            auto node = make_node(NodeKind::Unary, advance().pos);
            node->op = TokenKind::Bang;
            node->children.push_back(TRY(not_expr()));
            return seal(std::move(node));
        }
        return comparison();
    }

    NodeResult comparison() {
        return binary_chain(&Parser::concat, NodeKind::Binary,
                            {{TokenKind::Equal, TokenKind::Equal},
                             {TokenKind::NotEqual, TokenKind::NotEqual},
                             {TokenKind::Less, TokenKind::Less},
                             {TokenKind::LessEqual, TokenKind::LessEqual},
                             {TokenKind::Greater, TokenKind::Greater},
                             {TokenKind::GreaterEqual, TokenKind::GreaterEqual}});
    }

    NodeResult concat() {
        return binary_chain(&Parser::additive, NodeKind::Binary,
                            {{TokenKind::Concat, TokenKind::Concat}, {TokenKind::ListConcat, TokenKind::ListConcat}});
    }

    NodeResult additive() {
        return binary_chain(&Parser::term, NodeKind::Binary,
                            {{TokenKind::Plus, TokenKind::Plus}, {TokenKind::Minus, TokenKind::Minus}});
    }

    NodeResult term() {
        return binary_chain(&Parser::unary, NodeKind::Binary,
                            {{TokenKind::Star, TokenKind::Star}, {TokenKind::Slash, TokenKind::Slash}});
    }

    NodeResult unary() {
        NestingGuard guard{depth_};
        if (depth_ > MAX_NESTING_DEPTH) {
            return too_deep();
        }

        if (!check(TokenKind::Minus)) {
            return postfix();
        }

        SourcePos pos = advance().pos;

        // Fold "-<int>" so that the most negative integer is writable
        if (check(TokenKind::Integer)) {
            auto folded = TRY(integer_literal("-" + peek().text));
            advance();
            auto node = make_node(NodeKind::Literal, pos);
            node->literal = std::move(folded);
            return postfix_ops(TRY(seal(std::move(node))));
        }

        auto node = make_node(NodeKind::Unary, pos);
        node->op = TokenKind::Minus;
        node->children.push_back(TRY(unary()));
        return seal(std::move(node));
    }

    NodeResult postfix() {
        NodePtr target = TRY(primary());
        return postfix_ops(std::move(target));
    }

    NodeResult postfix_ops(NodePtr target) {
        while (true) {
            if (check(TokenKind::LParen)) {
                auto node = make_node(NodeKind::Call, advance().pos);
                node->children.push_back(std::move(target));
                auto args = TRY(arguments(TokenKind::RParen, "')'"));
                node->children.insert(node->children.end(), args.begin(), args.end());
                target = TRY(seal(std::move(node)));
            } else if (check(TokenKind::LBracket)) {
                auto node = make_node(NodeKind::Index, advance().pos);
                skip_separators();
                node->children.push_back(std::move(target));
                node->children.push_back(TRY(expression()));
                skip_separators();
                TRY(expect(TokenKind::RBracket, "']'"));
                target = TRY(seal(std::move(node)));
            } else {
                return target;
            }
        }
    }

    Expected<Value, Fault> integer_literal(std::string_view text) const {
        std::int64_t val{};
        auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), val);

        if (errc != std::errc{} || ptr != text.data() + text.size()) {
            return Fault{FaultKind::Syntax, fmt::format("integer literal {} is out of range", text), peek().pos.line};
        }

        return Value::integer(val);
    }

    Expected<Value, Fault> float_literal(std::string_view text) const {
        double val{};
        auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), val);

        if (errc != std::errc{} || ptr != text.data() + text.size()) {
            return Fault{FaultKind::Syntax, fmt::format("float literal {} is out of range", text), peek().pos.line};
        }

        return Value::floating(val);
    }

    NodeResult literal(Value value) {
        auto node = make_node(NodeKind::Literal, advance().pos);
        node->literal = std::move(value);
        return seal(std::move(node));
    }

    NodeResult primary() {
        const Token& tok = peek();

        switch (tok.kind) {
        case TokenKind::Integer:
            return literal(TRY(integer_literal(tok.text)));
        case TokenKind::Float:
            return literal(TRY(float_literal(tok.text)));
        case TokenKind::String:
            return literal(make_string(tok.text));
        case TokenKind::Atom:
            return literal(Value::atom(tok.text));
        case TokenKind::KwTrue:
            return literal(Value::boolean(true));
        case TokenKind::KwFalse:
            return literal(Value::boolean(false));
        case TokenKind::KwNil:
            return literal(Value{});

        case TokenKind::Identifier: {
            auto node = make_node(NodeKind::Variable, tok.pos);
            node->name = advance().text;
            return seal(std::move(node));
        }

        case TokenKind::ModuleName: {
            auto node = make_node(NodeKind::ModuleCall, tok.pos);
            node->name = advance().text;
            TRY(expect(TokenKind::Dot, "'.' after module name"));
            node->member = TRY(expect(TokenKind::Identifier, "function name")).text;
            TRY(expect(TokenKind::LParen, "'('"));
            node->children = TRY(arguments(TokenKind::RParen, "')'"));
            return seal(std::move(node));
        }

        case TokenKind::LBracket: {
            auto node = make_node(NodeKind::ListLit, advance().pos);
            node->children = TRY(arguments(TokenKind::RBracket, "']'"));
            return seal(std::move(node));
        }

        case TokenKind::LBrace: {
            auto node = make_node(NodeKind::TupleLit, advance().pos);
            node->children = TRY(arguments(TokenKind::RBrace, "'}'"));
            return seal(std::move(node));
        }

        case TokenKind::PercentBrace:
            return map_literal();

        case TokenKind::LParen: {
            advance();
            skip_separators();
            NodePtr inner = TRY(expression());
            skip_separators();
            TRY(expect(TokenKind::RParen, "')'"));
            return inner;
        }

        case TokenKind::KwFn:
            return lambda();

        case TokenKind::KwIf:
            return if_expr();

        case TokenKind::KwWhile: {
            auto node = make_node(NodeKind::While, advance().pos);
            node->children.push_back(TRY(expression()));
            TRY(expect(TokenKind::KwDo, "'do'"));
            node->children.push_back(TRY(block({TokenKind::KwEnd})));
            TRY(expect(TokenKind::KwEnd, "'end'"));
            return seal(std::move(node));
        }

        default:
            return error_here("an expression");
        }
    }

    NodeResult map_literal() {
        auto node = make_node(NodeKind::MapLit, advance().pos);

        skip_separators();
        if (match(TokenKind::RBrace)) {
            return seal(std::move(node));
        }

        while (true) {
            node->children.push_back(TRY(expression()));
            skip_separators();
            TRY(expect(TokenKind::FatArrow, "'=>'"));
            skip_separators();
            node->children.push_back(TRY(expression()));
            skip_separators();

            if (match(TokenKind::Comma)) {
                skip_separators();
                continue;
            }

            TRY(expect(TokenKind::RBrace, "'}'"));
            return seal(std::move(node));
        }
    }

    NodeResult lambda() {
        auto node = make_node(NodeKind::Lambda, advance().pos);

        if (match(TokenKind::LParen)) {
            node->params = TRY(parameters(TokenKind::RParen));
            TRY(expect(TokenKind::Arrow, "'->'"));
        } else {
            // fn x, y -> ... end
            node->params = TRY(parameters(TokenKind::Arrow));
        }

        node->children.push_back(TRY(block({TokenKind::KwEnd})));
        TRY(expect(TokenKind::KwEnd, "'end'"));

        return seal(std::move(node));
    }

    NodeResult if_expr() {
        auto node = make_node(NodeKind::If, advance().pos);

        node->children.push_back(TRY(expression()));
        TRY(expect(TokenKind::KwDo, "'do'"));
        node->children.push_back(TRY(block({TokenKind::KwElse, TokenKind::KwEnd})));

        if (match(TokenKind::KwElse)) {
            node->children.push_back(TRY(block({TokenKind::KwEnd})));
        }

        TRY(expect(TokenKind::KwEnd, "'end'"));

        return seal(std::move(node));
    }

    const std::vector<Token>& tokens_;
    std::size_t cursor_ = 0;
    std::size_t depth_ = 0;
};

Expected<Value, Fault> constant_value(const Node& node) {
    switch (node.kind) {
    case NodeKind::Literal:
        return node.literal;

    case NodeKind::Unary:
        if (node.op == TokenKind::Minus) {
            auto inner = TRY(constant_value(*node.children.front()));
            if (inner.type() == Value::Type::Float) {
                return Value::floating(-inner.as_float());
            }
            if (inner.type() == Value::Type::Integer && inner.as_int() != INT64_MIN) {
                return Value::integer(-inner.as_int());
            }
        }
        break;

    case NodeKind::ListLit:
    case NodeKind::TupleLit: {
        std::vector<Value> items;
        for (const auto& child : node.children) {
            items.push_back(TRY(constant_value(*child)));
        }
        return node.kind == NodeKind::ListLit ? make_list(std::move(items)) : make_tuple(std::move(items));
    }

    case NodeKind::MapLit: {
        std::vector<std::pair<Value, Value>> entries;
        for (std::size_t i = 0; i + 1 < node.children.size(); i += 2) {
            auto key = TRY(constant_value(*node.children[i]));
            auto val = TRY(constant_value(*node.children[i + 1]));
            entries.emplace_back(std::move(key), std::move(val));
        }
        return make_map(std::move(entries));
    }

    default:
        break;
    }

    return Fault{FaultKind::Syntax, fmt::format("expected a literal value, got {}", node.kind), node.pos.line};
}

} // namespace

Expected<Program, Fault> parse(const std::vector<Token>& tokens) {
    return Parser{tokens}.parse_program();
}

Expected<Program, Fault> parse(std::string_view source) {
    auto tokens = TRY(tokenize(source));
    return parse(tokens);
}

Expected<Value, Fault> parse_literal(std::string_view text) {
    auto program = TRY(parse(text));

    if (program.statements.size() != 1) {
        return Fault{FaultKind::Syntax,
                     fmt::format("expected exactly one literal value, got {} statements", program.statements.size())};
    }

    return constant_value(*program.statements.front());
}

} // namespace codekata::lang
