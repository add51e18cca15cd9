/**
 * @file Annotator.cpp
 * @brief Last-applied annotation handling
 */

#include "patchmaker/Annotator.hpp"
#include "patchmaker/DotPath.hpp"
#include "patchmaker/Errors.hpp"

namespace patchmaker {

namespace {

    constexpr const char* kStep = "set last applied annotation";

    Value& child_object(Value& parent, const char* key) {
        Value& child = parent[key];
        if (child.is_null()) {
            child = Value::object();
        } else if (!child.is_object()) {
            throw EncodingError(kStep,
                std::string(key) + " must be an object, got " + type_name(child));
        }
        return child;
    }

} // anonymous namespace

Annotator::Annotator(std::string key) : key_(std::move(key)) {}

Value Annotator::strip(const Value& object) const {
    Value copy = object;
    if (!copy.is_object()) {
        return copy;
    }

    auto metadata = copy.find("metadata");
    if (metadata == copy.end() || !metadata->is_object()) {
        return copy;
    }

    auto annotations = metadata->find("annotations");
    if (annotations == metadata->end() || !annotations->is_object()) {
        return copy;
    }

    if (annotations->erase(key_) > 0) {
        if (annotations->empty()) {
            metadata->erase("annotations");
        }
        if (metadata->empty()) {
            copy.erase("metadata");
        }
    }
    return copy;
}

void Annotator::set_last_applied(Value& object) const {
    if (!object.is_object()) {
        throw EncodingError(kStep, "object must be an object, got " + type_name(object));
    }

    std::string configuration;
    try {
        configuration = strip(object).dump();
    } catch (const Value::type_error& e) {
        throw EncodingError(kStep, e.what());
    }

    Value& metadata = child_object(object, "metadata");
    Value& annotations = child_object(metadata, "annotations");
    annotations[key_] = configuration;
}

Value Annotator::get_original_configuration(const Value& object) const {
    const Value* annotations = find_by_dot(object, "metadata.annotations");
    if (annotations == nullptr || !annotations->is_object()) {
        return Value();
    }

    auto it = annotations->find(key_);
    if (it == annotations->end()) {
        return Value();
    }
    if (!it->is_string()) {
        throw DecodingError("read last applied annotation",
                            "annotation must be a string, got " + type_name(*it));
    }

    try {
        return Value::parse(it->get<std::string>());
    } catch (const Value::parse_error& e) {
        throw DecodingError("read last applied annotation", e.what());
    }
}

} // namespace patchmaker
