#include "transcription.hpp"

#include <cctype>

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string Hypothesis::text() const {
    return joinTokens(tokens);
}

std::vector<Token> tokenizeText(const std::string& text, uint64_t pass) {
    std::vector<Token> tokens;

    size_t i = 0;
    bool saw_space = false;
    while (i < text.size()) {
        if (isSpace(text[i])) {
            saw_space = true;
            ++i;
            continue;
        }

        size_t start = i;
        while (i < text.size() && !isSpace(text[i])) ++i;

        Token token;
        token.text = text.substr(start, i - start);
        token.pass = pass;
        token.space_before = saw_space && !tokens.empty();
        tokens.push_back(std::move(token));
        saw_space = false;
    }

    return tokens;
}

std::string joinTokens(const std::vector<Token>& tokens) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0 && tokens[i].space_before) out += ' ';
        out += tokens[i].text;
    }
    return out;
}

std::string lastWords(const std::vector<Token>& tokens, size_t max_words) {
    size_t start = tokens.size() > max_words ? tokens.size() - max_words : 0;

    std::string out;
    for (size_t i = start; i < tokens.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += tokens[i].text;
    }
    return out;
}
