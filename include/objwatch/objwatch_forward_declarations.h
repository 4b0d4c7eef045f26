//
// Forward declarations for the objwatch runtime.
//

#ifndef OBJWATCH_FORWARD_DECLARATIONS_H
#define OBJWATCH_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>

namespace objwatch {
    enum class ObjectKind : uint8_t;

    class ObjectId;
    class Object;
    class Value;
    class DictObject;
    class TypeObject;
    class CodeObject;
    class FunctionObject;

    class ObjectHeap;
    class TypeAttributeCache;
    class WatcherContext;
    class Runtime;

    struct WatcherConfig;
    struct ObserverFailure;

    using object_ptr = std::shared_ptr<Object>;
    using dict_ptr = std::shared_ptr<DictObject>;
    using type_ptr = std::shared_ptr<TypeObject>;
    using code_ptr = std::shared_ptr<CodeObject>;
    using function_ptr = std::shared_ptr<FunctionObject>;
} // namespace objwatch

#endif // OBJWATCH_FORWARD_DECLARATIONS_H
