/**
 * @file Pointer.cpp
 * @brief Implementation of JSON Pointer interpretation and evaluation
 */

#include "jpatch/Pointer.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace jpatch {

namespace {
    /**
     * @brief Replace every occurrence of from with to, scanning left to right
     */
    std::string replace_all(const std::string& str, const std::string& from,
                            const std::string& to) {
        std::string result;
        result.reserve(str.size());

        std::size_t pos = 0;
        while (true) {
            const std::size_t hit = str.find(from, pos);
            if (hit == std::string::npos) {
                result.append(str, pos, std::string::npos);
                break;
            }
            result.append(str, pos, hit - pos);
            result += to;
            pos = hit + from.size();
        }
        return result;
    }

    /**
     * @brief Split on '/' keeping empty pieces ("/a//b" → ["", "a", "", "b"])
     */
    std::vector<std::string> split_pointer(const std::string& pointer) {
        std::vector<std::string> pieces;
        std::string current;

        for (char c : pointer) {
            if (c == '/') {
                pieces.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        pieces.push_back(current);

        return pieces;
    }

    /**
     * @brief Rebuild pointer text from tokens that include the leading one
     */
    std::string pointer_text(const std::vector<std::string>& tokens) {
        if (tokens.empty()) return "";
        return escape_token(tokens[0]) +
               join_pointer(std::vector<std::string>(tokens.begin() + 1, tokens.end()));
    }

    template <typename V>
    V& walk(V& document, const std::vector<std::string>& tokens,
            const std::string& pointer) {
        if (!is_container(document)) {
            throw RootNotObject();
        }

        // Each pointer MUST begin with '/'
        if (tokens.empty() || !tokens[0].empty()) {
            throw InvalidPointer(pointer);
        }

        V* current = &document;

        for (std::size_t i = 1; i < tokens.size(); ++i) {
            const auto& token = tokens[i];

            if (current->is_null()) {
                throw UnresolvedPointer(pointer);
            }

            if (current->is_array()) {
                if (token == "-") {
                    throw InvalidArrayReference();
                }
                if (!is_array_index(token)) {
                    throw InvalidArrayIndex(token);
                }

                const std::size_t idx = parse_array_index(token);
                if (idx >= current->size()) {
                    throw ArrayIndexOutOfBounds(token, idx);
                }
                current = &(*current)[idx];
            } else if (current->is_object()) {
                auto it = current->find(token);
                if (it == current->end()) {
                    throw KeyNotFound(token);
                }
                current = &(*it);
            } else {
                throw UnresolvableToken(token, type_name(*current));
            }
        }

        return *current;
    }
}

std::string unescape_token(const std::string& token) {
    // Order matters: "~01" must become "~1", not "/"
    return replace_all(replace_all(token, "~1", "/"), "~0", "~");
}

std::string escape_token(const std::string& token) {
    return replace_all(replace_all(token, "~", "~0"), "/", "~1");
}

PointerParts interpret_pointer(const std::string& pointer) {
    PointerParts parts;
    parts.pointer = pointer;

    for (const auto& piece : split_pointer(pointer)) {
        parts.tokens.push_back(unescape_token(piece));
    }

    const auto n = parts.tokens.size();
    if (n >= 2) {
        parts.parent = parts.tokens[n - 2];
        parts.key = parts.tokens[n - 1];
    }

    return parts;
}

std::string join_pointer(const std::vector<std::string>& tokens) {
    std::ostringstream oss;
    for (const auto& token : tokens) {
        oss << '/' << escape_token(token);
    }
    return oss.str();
}

bool is_array_index(const std::string& token) {
    if (token.empty()) return false;
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::size_t parse_array_index(const std::string& token) {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();

    std::size_t value = 0;
    for (char c : token) {
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) {
            return max;
        }
        value = value * 10 + digit;
    }
    return value;
}

const Value& evaluate(const Value& document, const std::string& pointer) {
    return walk(document, interpret_pointer(pointer).tokens, pointer);
}

Value& evaluate(Value& document, const std::string& pointer) {
    return walk(document, interpret_pointer(pointer).tokens, pointer);
}

const Value& evaluate_tokens(const Value& document, const std::vector<std::string>& tokens) {
    return walk(document, tokens, pointer_text(tokens));
}

Value& evaluate_tokens(Value& document, const std::vector<std::string>& tokens) {
    return walk(document, tokens, pointer_text(tokens));
}

bool contains_pointer(const Value& document, const std::string& pointer) {
    try {
        (void)evaluate(document, pointer);
        return true;
    } catch (const RootNotObject&) {
        throw;
    } catch (const InvalidPointer&) {
        throw;
    } catch (const PointerError&) {
        return false;
    }
}

} // namespace jpatch
