#include "bound_expression.hpp"
#include "errors.hpp"
#include "mesh.hpp"
#include "option.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

namespace asian_pricer {

struct BoundExpression::Node {
    enum class Kind { Number, Variable, Negate, Binary, Function };

    Kind kind = Kind::Number;
    double value = 0.0;
    std::string name;  // variable or function name
    char op = 0;       // binary operator
    std::vector<std::shared_ptr<const Node>> args;
};

namespace {

using Node = BoundExpression::Node;
using NodePtr = std::shared_ptr<const Node>;

const double PI = 3.14159265358979323846;

size_t functionArity(const std::string& name) {
    if (name == "exp" || name == "log" || name == "sqrt" || name == "abs") return 1;
    if (name == "min" || name == "max") return 2;
    return 0;
}

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text), pos_(0) {}

    NodePtr parse() {
        skipSpaces();
        if (pos_ >= text_.size()) {
            throw ExpressionError("Empty bound expression");
        }
        NodePtr root = parseSum();
        skipSpaces();
        if (pos_ < text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return root;
    }

private:
    const std::string& text_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw ExpressionError("Invalid bound expression '" + text_ + "' at position " +
                              std::to_string(pos_) + ": " + what);
    }

    void skipSpaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool accept(char c) {
        skipSpaces();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!accept(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    static NodePtr binary(char op, NodePtr lhs, NodePtr rhs) {
        auto node = std::make_shared<Node>();
        node->kind = Node::Kind::Binary;
        node->op = op;
        node->args = {std::move(lhs), std::move(rhs)};
        return node;
    }

    NodePtr parseSum() {
        NodePtr lhs = parseProduct();
        for (;;) {
            if (accept('+')) {
                lhs = binary('+', lhs, parseProduct());
            } else if (accept('-')) {
                lhs = binary('-', lhs, parseProduct());
            } else {
                return lhs;
            }
        }
    }

    NodePtr parseProduct() {
        NodePtr lhs = parseUnary();
        for (;;) {
            if (accept('*')) {
                lhs = binary('*', lhs, parseUnary());
            } else if (accept('/')) {
                lhs = binary('/', lhs, parseUnary());
            } else {
                return lhs;
            }
        }
    }

    NodePtr parseUnary() {
        if (accept('+')) {
            return parseUnary();
        }
        if (accept('-')) {
            auto node = std::make_shared<Node>();
            node->kind = Node::Kind::Negate;
            node->args = {parseUnary()};
            return node;
        }
        return parsePower();
    }

    // '^' binds tighter than unary minus on its left and is right-associative
    NodePtr parsePower() {
        NodePtr base = parsePrimary();
        if (accept('^')) {
            return binary('^', base, parseUnary());
        }
        return base;
    }

    NodePtr parsePrimary() {
        skipSpaces();
        if (pos_ >= text_.size()) {
            fail("unexpected end of input");
        }

        const char c = text_[pos_];
        if (accept('(')) {
            NodePtr inner = parseSum();
            expect(')');
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            return parseNumber();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            return parseName();
        }
        fail("unexpected '" + std::string(1, c) + "'");
    }

    size_t skipDigits() {
        const size_t start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        return pos_ - start;
    }

    NodePtr parseNumber() {
        // digits [. digits] [(e|E) [+-] digits]
        const size_t begin = pos_;
        const size_t intDigits = skipDigits();
        size_t fracDigits = 0;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            fracDigits = skipDigits();
        }
        if (intDigits + fracDigits == 0) {
            fail("malformed number");
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            size_t next = pos_ + 1;
            if (next < text_.size() && (text_[next] == '+' || text_[next] == '-')) {
                ++next;
            }
            if (next < text_.size() && std::isdigit(static_cast<unsigned char>(text_[next]))) {
                pos_ = next;
                skipDigits();
            }
        }
        if (pos_ < text_.size() &&
            (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_' || text_[pos_] == '.')) {
            fail("malformed number");
        }

        std::istringstream in(text_.substr(begin, pos_ - begin));
        in.imbue(std::locale::classic());
        double value = 0.0;
        in >> value;
        if (in.fail()) {
            fail("malformed number");
        }

        auto node = std::make_shared<Node>();
        node->kind = Node::Kind::Number;
        node->value = value;
        return node;
    }

    NodePtr parseName() {
        const size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        const std::string name = text_.substr(start, pos_ - start);

        auto node = std::make_shared<Node>();
        if (accept('(')) {
            const size_t arity = functionArity(name);
            if (arity == 0) {
                fail("unknown function '" + name + "'");
            }
            node->kind = Node::Kind::Function;
            node->name = name;
            node->args.push_back(parseSum());
            while (accept(',')) {
                node->args.push_back(parseSum());
            }
            expect(')');
            if (node->args.size() != arity) {
                fail("'" + name + "' takes " + std::to_string(arity) + " argument(s)");
            }
            return node;
        }

        if (name == "pi" || name == "e") {
            node->kind = Node::Kind::Number;
            node->value = (name == "pi") ? PI : std::exp(1.0);
            return node;
        }

        const auto& known = boundVariableNames();
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            fail("unknown name '" + name + "'");
        }
        node->kind = Node::Kind::Variable;
        node->name = name;
        return node;
    }
};

double evaluateNode(const Node& node, const ExpressionVariables& variables) {
    switch (node.kind) {
        case Node::Kind::Number:
            return node.value;
        case Node::Kind::Variable: {
            const auto it = variables.find(node.name);
            if (it == variables.end()) {
                throw ExpressionError("No value supplied for '" + node.name + "'");
            }
            return it->second;
        }
        case Node::Kind::Negate:
            return -evaluateNode(*node.args[0], variables);
        case Node::Kind::Binary: {
            const double lhs = evaluateNode(*node.args[0], variables);
            const double rhs = evaluateNode(*node.args[1], variables);
            switch (node.op) {
                case '+': return lhs + rhs;
                case '-': return lhs - rhs;
                case '*': return lhs * rhs;
                case '/': return lhs / rhs;
                case '^': return std::pow(lhs, rhs);
            }
            break;
        }
        case Node::Kind::Function: {
            const double a = evaluateNode(*node.args[0], variables);
            if (node.name == "exp") return std::exp(a);
            if (node.name == "log") return std::log(a);
            if (node.name == "sqrt") return std::sqrt(a);
            if (node.name == "abs") return std::abs(a);
            const double b = evaluateNode(*node.args[1], variables);
            if (node.name == "min") return std::min(a, b);
            if (node.name == "max") return std::max(a, b);
            break;
        }
    }
    throw ExpressionError("Corrupt bound expression node");
}

} // namespace

const std::vector<std::string>& boundVariableNames() {
    static const std::vector<std::string> names = {
        "x_min", "x_max", "T", "sigma", "r", "M", "N", "h", "k", "tau_max"
    };
    return names;
}

ExpressionVariables boundVariables(const ModelParameters& params, const SchemeCoefficients& coefficients) {
    return {
        {"x_min", params.xMin},
        {"x_max", params.xMax},
        {"T", params.T},
        {"sigma", params.sigma},
        {"r", params.r},
        {"M", static_cast<double>(params.M)},
        {"N", static_cast<double>(params.N)},
        {"h", coefficients.h},
        {"k", coefficients.k},
        {"tau_max", params.tauMax()},
    };
}

BoundExpression BoundExpression::parse(const std::string& text) {
    BoundExpression expression;
    expression.text_ = text;
    expression.root_ = Parser(text).parse();
    return expression;
}

double BoundExpression::evaluate(const ExpressionVariables& variables) const {
    if (!root_) {
        throw ExpressionError("Bound expression has not been parsed");
    }
    const double value = evaluateNode(*root_, variables);
    if (!std::isfinite(value)) {
        throw ExpressionError("Bound expression '" + text_ + "' does not evaluate to a finite number");
    }
    return value;
}

} // namespace asian_pricer
