#pragma once

#include <objwatch/runtime/runtime.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objwatch::test {

    // Callbacks that ignore their events, used to fill registry slots
    inline void ignore_dict(DictEvent, const DictObject &, const Value *, const Value *) {}

    inline void ignore_type(const TypeObject &) {}

    inline void ignore_code(CodeEvent, const CodeObject &) {}

    inline void ignore_function(FunctionEvent, ObjectId, const FunctionObject *, const Value *) {}

    // Records dict events as "Event:key:value" strings, key and value printed by repr
    struct DictEventLog {
        std::vector<std::string> events;

        [[nodiscard]] DictWatchCallback callback() {
            return [this](DictEvent event, const DictObject &, const Value *key, const Value *new_value) {
                std::string entry(to_string(event));
                if (key != nullptr) { entry += ":" + key->repr(); }
                if (new_value != nullptr) { entry += ":" + new_value->repr(); }
                events.push_back(std::move(entry));
            };
        }
    };

    struct TypeEventLog {
        std::vector<std::string> types;

        [[nodiscard]] TypeWatchCallback callback() {
            return [this](const TypeObject &type) { types.push_back(type.name()); };
        }
    };

    struct CodeEventLog {
        std::vector<std::pair<CodeEvent, ObjectId>> events;
        std::vector<std::string> names;

        [[nodiscard]] CodeWatchCallback callback() {
            return [this](CodeEvent event, const CodeObject &code) {
                events.emplace_back(event, code.id());
                names.push_back(code.name());
            };
        }
    };

    struct FunctionEventLog {
        struct Entry {
            FunctionEvent event;
            ObjectId function_id;
            bool has_function;
            std::optional<std::string> new_value;
        };

        std::vector<Entry> entries;

        [[nodiscard]] FunctionWatchCallback callback() {
            return [this](FunctionEvent event, ObjectId function_id, const FunctionObject *function,
                          const Value *new_value) {
                entries.push_back(Entry{event, function_id, function != nullptr,
                                        new_value != nullptr ? std::optional<std::string>(new_value->repr())
                                                             : std::nullopt});
            };
        }

        [[nodiscard]] std::vector<FunctionEvent> events() const {
            std::vector<FunctionEvent> result;
            for (const auto &entry : entries) { result.push_back(entry.event); }
            return result;
        }
    };

    // Collects failures routed through the unraisable channel
    struct FailureLog {
        std::vector<ObserverFailure> failures;

        [[nodiscard]] UnraisableHook hook() {
            return [this](const ObserverFailure &failure) { failures.push_back(failure); };
        }
    };

} // namespace objwatch::test
