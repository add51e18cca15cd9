/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "patchmaker/DotPath.hpp"

#include <cstddef>
#include <limits>
#include <sstream>

namespace patchmaker {

namespace {

    /**
     * @brief Parse an array index segment
     *
     * Only canonical non-negative integers that fit in size_t qualify
     * ("0", "12"); "01", "-1", "x" and overflowing numbers do not.
     */
    bool parse_index(const std::string& segment, std::size_t& index) {
        if (segment.empty() || (segment.size() > 1 && segment.front() == '0')) {
            return false;
        }
        std::size_t value = 0;
        for (char c : segment) {
            if (c < '0' || c > '9') {
                return false;
            }
            const auto digit = static_cast<std::size_t>(c - '0');
            if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                return false;
            }
            value = value * 10 + digit;
        }
        index = value;
        return true;
    }

    template <typename V>
    V* step_into(V* node, const std::string& segment) {
        if (node->is_object()) {
            auto it = node->find(segment);
            return it != node->end() ? &*it : nullptr;
        }
        std::size_t index = 0;
        if (node->is_array() && parse_index(segment, index) && index < node->size()) {
            return &(*node)[index];
        }
        return nullptr;
    }

    /**
     * @brief Walk every segment but the last
     * @return Container holding the last segment, or nullptr
     */
    Value* walk_to_parent(Value& data, const std::vector<std::string>& segments) {
        Value* node = &data;
        for (std::size_t i = 0; node != nullptr && i + 1 < segments.size(); ++i) {
            node = step_into(node, segments[i]);
        }
        return node;
    }

} // anonymous namespace

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::istringstream in(path);
    std::string segment;
    while (std::getline(in, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
    }
    return segments;
}

const Value* find_by_dot(const Value& data, const std::string& path) {
    const Value* node = &data;
    for (const auto& segment : split_dot_path(path)) {
        if ((node = step_into(node, segment)) == nullptr) {
            break;
        }
    }
    return node;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    Value* node = &data;
    for (const auto& segment : split_dot_path(path)) {
        if (!node->is_object()) {
            *node = Value::object();
        }
        // operator[] inserts a null member; it is replaced on the next step
        node = &(*node)[segment];
    }
    *node = value;
}

bool erase_by_dot(Value& data, const std::string& path) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        return false;
    }

    Value* parent = walk_to_parent(data, segments);
    if (parent == nullptr) {
        return false;
    }

    if (parent->is_object()) {
        return parent->erase(segments.back()) != 0;
    }
    std::size_t index = 0;
    if (parent->is_array() && parse_index(segments.back(), index) && index < parent->size()) {
        parent->erase(index);
        return true;
    }
    return false;
}

} // namespace patchmaker
