#include <objwatch/runtime/runtime.h>
#include <objwatch/types/code_object.h>

namespace objwatch {

    CodeObject::CodeObject(Runtime &runtime, ObjectId id, std::string name, std::string qualname,
                           std::string filename, int first_line)
        : Object(runtime, ObjectKind::Code, id), _name(std::move(name)),
          _qualname(qualname.empty() ? _name : std::move(qualname)), _filename(std::move(filename)),
          _first_line(first_line) {}

    std::string CodeObject::repr() const {
        return fmt::format("<code object {} at {}, file \"{}\", line {}>", _name, id(), _filename, _first_line);
    }

    void CodeObject::on_dealloc() noexcept { runtime().watchers().notify_code(CodeEvent::Destroyed, *this); }

} // namespace objwatch
