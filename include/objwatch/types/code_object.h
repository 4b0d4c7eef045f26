//
// CodeObject - compiled code descriptor.
//

#ifndef OBJWATCH_CODE_OBJECT_H
#define OBJWATCH_CODE_OBJECT_H

#include <objwatch/types/object.h>

#include <string>

namespace objwatch {

    /**
     * Immutable once created. Code watchers see Created when Runtime::new_code returns and Destroyed from the
     * destroy hook, while the object is still readable.
     */
    class OBJWATCH_EXPORT CodeObject final : public Object {
    public:
        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        [[nodiscard]] const std::string &qualname() const noexcept { return _qualname; }

        [[nodiscard]] const std::string &filename() const noexcept { return _filename; }

        [[nodiscard]] int first_line() const noexcept { return _first_line; }

        [[nodiscard]] std::string repr() const override;

    protected:
        void on_dealloc() noexcept override;

    private:
        friend class Runtime;

        CodeObject(Runtime &runtime, ObjectId id, std::string name, std::string qualname, std::string filename,
                   int first_line);

        std::string _name;
        std::string _qualname;
        std::string _filename;
        int _first_line;
    };

} // namespace objwatch

#endif // OBJWATCH_CODE_OBJECT_H
