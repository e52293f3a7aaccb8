/// @file search_filter.cpp
/// @brief Search filter construction, rewriting and evaluation.

#include "otpm/token/search_filter.hpp"

#include "otpm/foundation/otp_logger.hpp"
#include "otpm/token/schema_resolver.hpp"

#include "detail/text_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <vector>

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

// -- Construction -------------------------------------------------------------

std::string typePredicate(TokenType type) {
    return "(" + std::string(attr::kObjectClass) + "=" + schemaClassFor(type) + ")";
}

std::string rewriteTypePredicate(std::string_view filter,
                                 const std::optional<std::string>& type) {
    std::string out(filter);
    if (!type) {
        return out;
    }
    auto parsed = parseTokenType(*type);
    if (!parsed) {
        OTPM_LOG_DEBUG(LogCategory::Search, "ignoring unknown type filter '" + *type + "'");
        return out;
    }

    auto replacement = typePredicate(*parsed);
    std::size_t pos = 0;
    while ((pos = out.find(kGenericTokenPredicate, pos)) != std::string::npos) {
        out.replace(pos, kGenericTokenPredicate.size(), replacement);
        pos += replacement.size();
    }
    return out;
}

std::string escapeFilterValue(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '*':  out += "\\2a"; break;
            case '(':  out += "\\28"; break;
            case ')':  out += "\\29"; break;
            case '\\': out += "\\5c"; break;
            case '\0': out += "\\00"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string buildSearchFilter(const SearchRequest& request,
                              const std::optional<std::string>& ownerReference) {
    auto equality = [](std::string_view name, std::string_view value) {
        return "(" + std::string(name) + "=" + escapeFilterValue(value) + ")";
    };

    std::string filter = "(&";
    filter += kGenericTokenPredicate;

    if (!request.criteria.empty()) {
        auto term = escapeFilterValue(request.criteria);
        filter += "(|";
        filter += "(" + std::string(attr::kTokenId) + "=*" + term + "*)";
        for (auto field : kInfoFieldNames) {
            filter += "(" + std::string(infoAttribute(field)) + "=*" + term + "*)";
        }
        filter += ")";
    }
    if (ownerReference) {
        filter += equality(attr::kOwner, *ownerReference);
    }
    if (request.disabled) {
        filter += equality(attr::kDisabled, *request.disabled ? "TRUE" : "FALSE");
    }
    for (const auto& [field, value] : request.info) {
        if (isInfoField(field)) {
            filter += equality(infoAttribute(field), value);
        }
    }
    filter += ")";
    return filter;
}

// -- Evaluation ---------------------------------------------------------------

struct FilterExpression::Node {
    enum class Kind { And, Or, Not, Equal, Present, Substring };

    Kind kind = Kind::Equal;
    std::string attribute;
    std::string value;                 ///< Equal
    std::vector<std::string> parts;    ///< Substring: initial, any..., final
    std::vector<std::shared_ptr<const Node>> children;
};

namespace {

using Node = FilterExpression::Node;

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    OtpResult<std::shared_ptr<const Node>> parseFilter() {
        if (!consume('(')) {
            return fail("expected '('");
        }
        auto node = std::make_shared<Node>();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of filter");
        }
        char op = text_[pos_];
        if (op == '&' || op == '|') {
            ++pos_;
            node->kind = op == '&' ? Node::Kind::And : Node::Kind::Or;
            while (pos_ < text_.size() && text_[pos_] == '(') {
                auto child = parseFilter();
                if (child.hasError()) {
                    return child;
                }
                node->children.push_back(std::move(child).value());
            }
            if (node->children.empty()) {
                return fail("empty filter list");
            }
        } else if (op == '!') {
            ++pos_;
            node->kind = Node::Kind::Not;
            auto child = parseFilter();
            if (child.hasError()) {
                return child;
            }
            node->children.push_back(std::move(child).value());
        } else {
            auto item = parseItem(*node);
            if (item.hasError()) {
                return OtpResult<std::shared_ptr<const Node>>::err(item.error());
            }
        }
        if (!consume(')')) {
            return fail("expected ')'");
        }
        return OtpResult<std::shared_ptr<const Node>>::ok(std::move(node));
    }

    [[nodiscard]] bool atEnd() const { return pos_ == text_.size(); }

private:
    OtpResult<void> parseItem(Node& node) {
        auto eq = text_.find('=', pos_);
        auto close = text_.find(')', pos_);
        if (eq == std::string_view::npos || eq > close || eq == pos_) {
            return OtpResult<void>::err(
                OtpError(ErrorCode::InvalidFilter, "malformed filter item"));
        }
        node.attribute = detail::toLower(text_.substr(pos_, eq - pos_));
        pos_ = eq + 1;

        // Split the raw value on unescaped '*', unescaping each part.
        std::vector<std::string> parts(1);
        while (pos_ < text_.size() && text_[pos_] != ')') {
            char c = text_[pos_];
            if (c == '(') {
                return OtpResult<void>::err(
                    OtpError(ErrorCode::InvalidFilter, "unescaped '(' in filter value"));
            }
            if (c == '*') {
                parts.emplace_back();
                ++pos_;
            } else if (c == '\\') {
                if (pos_ + 2 >= text_.size()) {
                    return OtpResult<void>::err(
                        OtpError(ErrorCode::InvalidFilter, "truncated escape in filter value"));
                }
                auto hex = std::string(text_.substr(pos_ + 1, 2));
                if (!std::isxdigit(static_cast<unsigned char>(hex[0])) ||
                    !std::isxdigit(static_cast<unsigned char>(hex[1]))) {
                    return OtpResult<void>::err(
                        OtpError(ErrorCode::InvalidFilter, "invalid escape in filter value"));
                }
                auto byte = std::strtol(hex.c_str(), nullptr, 16);
                parts.back().push_back(static_cast<char>(byte));
                pos_ += 3;
            } else {
                parts.back().push_back(c);
                ++pos_;
            }
        }

        if (parts.size() == 1) {
            node.kind = Node::Kind::Equal;
            node.value = detail::toLower(parts.front());
        } else if (parts.size() == 2 && parts[0].empty() && parts[1].empty()) {
            node.kind = Node::Kind::Present;
        } else {
            node.kind = Node::Kind::Substring;
            for (auto& part : parts) {
                node.parts.push_back(detail::toLower(part));
            }
        }
        return OtpResult<void>::ok();
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    OtpResult<std::shared_ptr<const Node>> fail(std::string_view what) const {
        return OtpResult<std::shared_ptr<const Node>>::err(
            OtpError(ErrorCode::InvalidFilter,
                     std::string(what) + " at offset " + std::to_string(pos_)));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

const std::vector<std::string>* findValues(const AttributeMap& attributes,
                                           const std::string& lowerName) {
    for (const auto& [name, values] : attributes) {
        if (detail::equalsIgnoreCase(name, lowerName)) {
            return &values;
        }
    }
    return nullptr;
}

bool substringMatches(const std::string& value, const std::vector<std::string>& parts) {
    const auto& initial = parts.front();
    const auto& final = parts.back();
    if (value.size() < initial.size() + final.size() ||
        value.compare(0, initial.size(), initial) != 0 ||
        value.compare(value.size() - final.size(), final.size(), final) != 0) {
        return false;
    }
    std::size_t pos = initial.size();
    auto limit = value.size() - final.size();
    for (std::size_t i = 1; i + 1 < parts.size(); ++i) {
        auto found = value.find(parts[i], pos);
        if (found == std::string::npos || found + parts[i].size() > limit) {
            return false;
        }
        pos = found + parts[i].size();
    }
    return true;
}

bool evaluate(const Node& node, const AttributeMap& attributes) {
    switch (node.kind) {
        case Node::Kind::And:
            for (const auto& child : node.children) {
                if (!evaluate(*child, attributes)) return false;
            }
            return true;
        case Node::Kind::Or:
            for (const auto& child : node.children) {
                if (evaluate(*child, attributes)) return true;
            }
            return false;
        case Node::Kind::Not:
            return !evaluate(*node.children.front(), attributes);
        case Node::Kind::Present: {
            const auto* values = findValues(attributes, node.attribute);
            return values != nullptr && !values->empty();
        }
        case Node::Kind::Equal:
        case Node::Kind::Substring: {
            const auto* values = findValues(attributes, node.attribute);
            if (values == nullptr) {
                return false;
            }
            for (const auto& value : *values) {
                auto lower = detail::toLower(value);
                bool hit = node.kind == Node::Kind::Equal ? lower == node.value
                                                          : substringMatches(lower, node.parts);
                if (hit) return true;
            }
            return false;
        }
    }
    return false;
}

}  // namespace

OtpResult<FilterExpression> FilterExpression::parse(std::string_view text) {
    Parser parser(text);
    auto root = parser.parseFilter();
    if (root.hasError()) {
        return OtpResult<FilterExpression>::err(root.error());
    }
    if (!parser.atEnd()) {
        return OtpResult<FilterExpression>::err(
            OtpError(ErrorCode::InvalidFilter, "trailing characters after filter"));
    }
    return OtpResult<FilterExpression>::ok(FilterExpression(std::move(root).value()));
}

bool FilterExpression::matches(const AttributeMap& attributes) const {
    return root_ && evaluate(*root_, attributes);
}

}  // namespace otpm::token
