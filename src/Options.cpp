/**
 * @file Options.cpp
 * @brief Implementation of the option pipeline and built-in options
 */

#include "patchmaker/Options.hpp"
#include "patchmaker/DotPath.hpp"
#include "patchmaker/Errors.hpp"
#include "patchmaker/Value.hpp"

#include <exception>

namespace patchmaker {

namespace {

    Value parse_side(const std::string& bytes, const char* side) {
        try {
            return Value::parse(bytes);
        } catch (const Value::parse_error& e) {
            throw OptionError(std::string("parse ") + side + " document", e.what());
        }
    }

    /**
     * @brief Build an option that rewrites both sides with the same function
     */
    CalculateOption rewrite_both(std::function<void(Value&)> rewrite) {
        return [rewrite = std::move(rewrite)](const std::string& current,
                                             const std::string& modified) {
            Value current_doc = parse_side(current, "current");
            Value modified_doc = parse_side(modified, "modified");
            rewrite(current_doc);
            rewrite(modified_doc);
            return BytePair{current_doc.dump(), modified_doc.dump()};
        };
    }

    void remove_nulls(Value& doc) {
        if (doc.is_object()) {
            for (auto it = doc.begin(); it != doc.end();) {
                if (it->is_null()) {
                    it = doc.erase(it);
                } else {
                    remove_nulls(*it);
                    ++it;
                }
            }
        } else if (doc.is_array()) {
            for (auto& elem : doc) {
                remove_nulls(elem);
            }
        }
    }

} // anonymous namespace

BytePair apply_options(const std::string& current,
                       const std::string& modified,
                       const std::vector<CalculateOption>& options) {
    BytePair pair{current, modified};
    for (size_t i = 0; i < options.size(); ++i) {
        try {
            pair = options[i](pair.current, pair.modified);
        } catch (const std::exception& e) {
            throw OptionError("apply option function #" + std::to_string(i), e.what());
        }
    }
    return pair;
}

CalculateOption ignore_status_fields() {
    return ignore_field("status");
}

CalculateOption ignore_field(const std::string& path) {
    return rewrite_both([path](Value& doc) { erase_by_dot(doc, path); });
}

CalculateOption ignore_fields(const std::vector<std::string>& paths) {
    return rewrite_both([paths](Value& doc) {
        for (const auto& path : paths) {
            erase_by_dot(doc, path);
        }
    });
}

CalculateOption delete_null_in_json() {
    return rewrite_both(remove_nulls);
}

} // namespace patchmaker
