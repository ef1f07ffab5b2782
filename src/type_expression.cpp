// ═══════════════════════════════════════════════════════════════════
//  src/type_expression.cpp — Tokenizer and recursive-descent recognizer
// ═══════════════════════════════════════════════════════════════════
//
//  Grammar (subset of TypeScript types):
//
//    type          := functionType | conditional
//    conditional   := union ( 'extends' union '?' type ':' type )?
//    union         := '|'? intersection ( '|' intersection )*
//    intersection  := '&'? operator ( '&' operator )*
//    operator      := ('keyof' | 'unique' | 'readonly') operator
//                   | 'infer' Ident | postfix
//    postfix       := primary ( '[' ']' | '[' type ']' )*
//    primary       := literal | '(' type ')' | objectType | tuple
//                   | 'typeof' name typeArgs? | name typeArgs?
//    functionType  := 'new'? typeParams? '(' params ')' '=>' type
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/type_expression.h"

#include <set>
#include <stdexcept>
#include <vector>

namespace gqlts {

namespace detail {

struct TypeSyntaxError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class TokenKind { Identifier, String, Number, Template, Punct, End };

struct Token {
    TokenKind kind;
    std::string text;
    std::size_t offset;
};

// ═══════════════════════════════════════════
//  Tokenizer
// ═══════════════════════════════════════════
class TypeTokenizer {
public:
    explicit TypeTokenizer(const std::string& source) : source_(source), pos_(0) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skipWhitespace();
            if (pos_ >= source_.size()) {
                tokens.push_back({TokenKind::End, "", pos_});
                return tokens;
            }
            tokens.push_back(next());
        }
    }

private:
    const std::string& source_;
    std::size_t pos_;

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size() &&
               (source_[pos_] == ' ' || source_[pos_] == '\t' ||
                source_[pos_] == '\n' || source_[pos_] == '\r')) {
            pos_++;
        }
    }

    static bool isIdentStart(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    [[noreturn]] void fail(const std::string& what) const {
        throw TypeSyntaxError(what + " at offset " + std::to_string(pos_));
    }

    Token next() {
        std::size_t start = pos_;
        char c = peek();

        if (isIdentStart(c)) {
            while (isIdentStart(peek()) || isDigit(peek())) pos_++;
            return {TokenKind::Identifier, source_.substr(start, pos_ - start), start};
        }

        if (isDigit(c)) {
            while (isDigit(peek()) || peek() == '.') pos_++;
            return {TokenKind::Number, source_.substr(start, pos_ - start), start};
        }

        if (c == '\'' || c == '"') {
            pos_++;
            while (peek() != c) {
                if (peek() == '\0' || peek() == '\n') fail("unterminated string literal");
                if (peek() == '\\') pos_++;
                pos_++;
            }
            pos_++;
            return {TokenKind::String, source_.substr(start, pos_ - start), start};
        }

        if (c == '`') {
            pos_++;
            int depth = 0;
            while (depth > 0 || peek() != '`') {
                if (peek() == '\0') fail("unterminated template literal");
                if (peek() == '\\') {
                    pos_ += 2;
                    continue;
                }
                if (depth == 0 && peek() == '$' && peek(1) == '{') {
                    depth++;
                    pos_ += 2;
                    continue;
                }
                if (depth > 0 && peek() == '{') depth++;
                if (depth > 0 && peek() == '}') depth--;
                pos_++;
            }
            pos_++;
            return {TokenKind::Template, source_.substr(start, pos_ - start), start};
        }

        if (c == '=' && peek(1) == '>') {
            pos_ += 2;
            return {TokenKind::Punct, "=>", start};
        }

        if (c == '.' && peek(1) == '.' && peek(2) == '.') {
            pos_ += 3;
            return {TokenKind::Punct, "...", start};
        }

        static const std::string punctuation = "|&()[]{}<>,:;?.=-+";
        if (punctuation.find(c) != std::string::npos) {
            pos_++;
            return {TokenKind::Punct, std::string(1, c), start};
        }

        fail(std::string("unexpected character '") + c + "'");
    }
};

// ═══════════════════════════════════════════
//  Recognizer
// ═══════════════════════════════════════════
class TypeExpressionParser {
public:
    explicit TypeExpressionParser(std::vector<Token> tokens)
        : tokens_(std::move(tokens)), pos_(0) {}

    void parse() {
        if (at(TokenKind::End)) fail("empty type expression");
        parseType();
        if (!at(TokenKind::End)) fail("unexpected '" + current().text + "'");
    }

private:
    std::vector<Token> tokens_;
    std::size_t pos_;

    const Token& current() const { return tokens_[pos_]; }

    const Token& lookahead(std::size_t ahead) const {
        auto index = pos_ + ahead;
        return index < tokens_.size() ? tokens_[index] : tokens_.back();
    }

    bool at(TokenKind kind) const { return current().kind == kind; }

    bool atPunct(const char* text) const {
        return current().kind == TokenKind::Punct && current().text == text;
    }

    bool atKeyword(const char* word) const {
        return current().kind == TokenKind::Identifier && current().text == word;
    }

    void advance() {
        if (!at(TokenKind::End)) pos_++;
    }

    bool accept(const char* punct) {
        if (!atPunct(punct)) return false;
        advance();
        return true;
    }

    void expect(const char* punct) {
        if (!accept(punct)) {
            fail(std::string("expected '") + punct + "'");
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw TypeSyntaxError(what + " at offset " + std::to_string(current().offset));
    }

    static bool isReserved(const std::string& word) {
        static const std::set<std::string> words = {
            "extends", "implements", "function", "class", "return", "if", "else",
            "var", "let", "const", "in", "instanceof", "delete", "export", "import",
        };
        return words.count(word) > 0;
    }

    std::string expectIdentifier() {
        if (!at(TokenKind::Identifier) || isReserved(current().text)) {
            fail("expected an identifier");
        }
        auto text = current().text;
        advance();
        return text;
    }

    // ── type := functionType | conditional ──
    void parseType() {
        if (startsFunctionType()) {
            parseFunctionType();
            return;
        }

        parseUnion();
        if (atKeyword("extends")) {
            advance();
            parseUnion();
            expect("?");
            parseType();
            expect(":");
            parseType();
        }
    }

    // '(' ... ')' '=>' decides between a function type and a parenthesized type.
    bool startsFunctionType() const {
        if (atPunct("<")) return true;
        if (atKeyword("new")) return true;
        if (!atPunct("(")) return false;

        int depth = 0;
        for (std::size_t i = pos_; i < tokens_.size(); ++i) {
            auto& tok = tokens_[i];
            if (tok.kind != TokenKind::Punct) continue;
            if (tok.text == "(") depth++;
            if (tok.text == ")" && --depth == 0) {
                return i + 1 < tokens_.size() && tokens_[i + 1].kind == TokenKind::Punct &&
                       tokens_[i + 1].text == "=>";
            }
        }
        return false;
    }

    void parseFunctionType() {
        if (atKeyword("new")) advance();
        if (atPunct("<")) parseTypeParameters();
        parseParameters();
        expect("=>");
        parseType();
    }

    void parseTypeParameters() {
        expect("<");
        do {
            expectIdentifier();
            if (atKeyword("extends")) {
                advance();
                parseType();
            }
            if (accept("=")) parseType();
        } while (accept(","));
        expect(">");
    }

    void parseParameters() {
        expect("(");
        while (!atPunct(")")) {
            accept("...");
            expectIdentifier();
            accept("?");
            if (accept(":")) parseType();
            if (!accept(",")) break;
        }
        expect(")");
    }

    void parseUnion() {
        accept("|");
        parseIntersection();
        while (accept("|")) parseIntersection();
    }

    void parseIntersection() {
        accept("&");
        parseTypeOperator();
        while (accept("&")) parseTypeOperator();
    }

    void parseTypeOperator() {
        if ((atKeyword("keyof") || atKeyword("unique") || atKeyword("readonly")) &&
            startsOperand(lookahead(1))) {
            advance();
            parseTypeOperator();
            return;
        }
        if (atKeyword("infer") && lookahead(1).kind == TokenKind::Identifier) {
            advance();
            expectIdentifier();
            return;
        }
        parsePostfix();
    }

    static bool startsOperand(const Token& tok) {
        if (tok.kind == TokenKind::End) return false;
        if (tok.kind != TokenKind::Punct) return true;
        return tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "-";
    }

    void parsePostfix() {
        parsePrimary();
        while (atPunct("[")) {
            advance();
            if (!accept("]")) {
                parseType();
                expect("]");
            }
        }
    }

    void parsePrimary() {
        switch (current().kind) {
            case TokenKind::String:
            case TokenKind::Number:
            case TokenKind::Template:
                advance();
                return;
            case TokenKind::Identifier:
                parseTypeReference();
                return;
            case TokenKind::End:
                fail("expected a type");
            case TokenKind::Punct:
                break;
        }

        if (atPunct("-") && lookahead(1).kind == TokenKind::Number) {
            advance();
            advance();
        } else if (accept("(")) {
            parseType();
            expect(")");
        } else if (atPunct("{")) {
            parseObjectType();
        } else if (atPunct("[")) {
            parseTuple();
        } else {
            fail("expected a type");
        }
    }

    void parseTypeReference() {
        if (atKeyword("typeof")) {
            advance();
        }
        expectIdentifier();
        while (accept(".")) expectIdentifier();
        if (atPunct("<")) parseTypeArguments();
    }

    void parseTypeArguments() {
        expect("<");
        do {
            parseType();
        } while (accept(","));
        expect(">");
    }

    void parseTuple() {
        expect("[");
        while (!atPunct("]")) {
            accept("...");
            bool named = at(TokenKind::Identifier) &&
                (lookahead(1).text == ":" ||
                 (lookahead(1).text == "?" && lookahead(2).text == ":"));
            if (named) {
                advance();
                accept("?");
                expect(":");
            }
            parseType();
            accept("?");
            if (!accept(",")) break;
        }
        expect("]");
    }

    void parseObjectType() {
        expect("{");
        while (!atPunct("}")) {
            parseMember();
            if (!accept(";") && !accept(",")) break;
        }
        expect("}");
    }

    void parseMember() {
        if (atPunct("(") || atPunct("<")) {
            // call signature
            if (atPunct("<")) parseTypeParameters();
            parseParameters();
            expect(":");
            parseType();
            return;
        }

        if (atKeyword("readonly") &&
            (lookahead(1).kind != TokenKind::Punct || lookahead(1).text == "[")) {
            advance();
        }

        if (accept("[")) {
            expectIdentifier();
            if (atKeyword("in")) {
                // mapped type member: [K in Keys]?: T
                advance();
                parseType();
                expect("]");
                accept("?");
            } else {
                // index signature: [key: K]: T
                expect(":");
                parseType();
                expect("]");
            }
            expect(":");
            parseType();
            return;
        }

        if (at(TokenKind::Identifier) || at(TokenKind::String) || at(TokenKind::Number)) {
            advance();
        } else {
            fail("expected a property name");
        }
        accept("?");

        if (atPunct("(") || atPunct("<")) {
            // method signature
            if (atPunct("<")) parseTypeParameters();
            parseParameters();
        }
        expect(":");
        parseType();
    }
};

} // namespace detail

std::optional<std::string> checkTypeExpression(const std::string& source) {
    try {
        detail::TypeTokenizer tokenizer(source);
        detail::TypeExpressionParser parser(tokenizer.tokenize());
        parser.parse();
        return std::nullopt;
    } catch (const detail::TypeSyntaxError& e) {
        return std::string(e.what());
    }
}

} // namespace gqlts
