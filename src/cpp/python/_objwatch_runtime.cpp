#include <objwatch/python/py_objwatch.h>
#include <objwatch/runtime/observers/watcher_trace.h>
#include <objwatch/runtime/runtime.h>

namespace objwatch {

    namespace {
        nb::object optional_value(const Value *value) { return value != nullptr ? value_to_python(*value) : nb::none(); }

        WatcherContext &context(Runtime &runtime) { return runtime.watchers(); }
    } // namespace

    void export_runtime(nb::module_ &m) {
        m.attr("MAX_WATCHERS") = MAX_WATCHERS;

        nb::class_<WatcherConfig>(m, "WatcherConfig")
            .def(nb::init<>())
            .def_rw("dict_max_watchers", &WatcherConfig::dict_max_watchers)
            .def_rw("type_max_watchers", &WatcherConfig::type_max_watchers)
            .def_rw("code_max_watchers", &WatcherConfig::code_max_watchers)
            .def_rw("function_max_watchers", &WatcherConfig::function_max_watchers)
            .def_rw("clear_subscriptions_on_clear", &WatcherConfig::clear_subscriptions_on_clear)
            .def_rw("type_cache_size", &WatcherConfig::type_cache_size)
            .def("validate", &WatcherConfig::validate);

        nb::class_<ObserverFailure>(m, "ObserverFailure")
            .def_ro("kind", &ObserverFailure::kind)
            .def_ro("watcher_id", &ObserverFailure::watcher_id)
            .def_ro("object_id", &ObserverFailure::object_id)
            .def_ro("object_repr", &ObserverFailure::object_repr)
            .def_ro("error_msg", &ObserverFailure::error_msg)
            .def_ro("stack_trace", &ObserverFailure::stack_trace)
            .def("__str__", &ObserverFailure::to_string);

        nb::class_<Runtime>(m, "Runtime")
            .def(nb::init<WatcherConfig>(), "config"_a = WatcherConfig{})
            .def_prop_ro("object_type", &Runtime::object_type)
            .def("new_dict", &Runtime::new_dict, nb::keep_alive<0, 1>())
            .def("new_type", &Runtime::new_type, "name"_a, "bases"_a = std::vector<type_ptr>{}, nb::keep_alive<0, 1>())
            .def("new_code", &Runtime::new_code, "name"_a, "filename"_a = "<string>", "first_line"_a = 1,
                 "qualname"_a = "", nb::keep_alive<0, 1>())
            .def("new_function", &Runtime::new_function, "code"_a, "qualname"_a = "", nb::keep_alive<0, 1>())
            .def_prop_ro("live_objects", [](const Runtime &self) { return self.heap().live_count(); })
            .def("add_dict_watcher",
                 [](Runtime &self, nb::callable callback) {
                     return context(self).add_dict_watcher(
                         [callback](DictEvent event, const DictObject &dict, const Value *key, const Value *new_value) {
                             nb::gil_scoped_acquire gil;
                             callback(event, object_to_python(dict), optional_value(key), optional_value(new_value));
                         });
                 })
            .def("clear_dict_watcher", [](Runtime &self, int id) { context(self).clear_dict_watcher(id); })
            .def("watch_dict", [](Runtime &self, int id, Object &obj) { context(self).watch_dict(id, obj); })
            .def("unwatch_dict", [](Runtime &self, int id, Object &obj) { context(self).unwatch_dict(id, obj); })
            .def("add_type_watcher",
                 [](Runtime &self, nb::callable callback) {
                     return context(self).add_type_watcher([callback](const TypeObject &type) {
                         nb::gil_scoped_acquire gil;
                         callback(object_to_python(type));
                     });
                 })
            .def("clear_type_watcher", [](Runtime &self, int id) { context(self).clear_type_watcher(id); })
            .def("watch_type", [](Runtime &self, int id, Object &obj) { context(self).watch_type(id, obj); })
            .def("unwatch_type", [](Runtime &self, int id, Object &obj) { context(self).unwatch_type(id, obj); })
            .def("add_code_watcher",
                 [](Runtime &self, nb::callable callback) {
                     return context(self).add_code_watcher([callback](CodeEvent event, const CodeObject &code) {
                         nb::gil_scoped_acquire gil;
                         callback(event, object_to_python(code));
                     });
                 })
            .def("clear_code_watcher", [](Runtime &self, int id) { context(self).clear_code_watcher(id); })
            .def("watch_code", [](Runtime &self, int id, Object &obj) { context(self).watch_code(id, obj); })
            .def("unwatch_code", [](Runtime &self, int id, Object &obj) { context(self).unwatch_code(id, obj); })
            .def("add_function_watcher",
                 [](Runtime &self, nb::callable callback) {
                     return context(self).add_function_watcher([callback](FunctionEvent event, ObjectId function_id,
                                                                           const FunctionObject *function,
                                                                           const Value *new_value) {
                         nb::gil_scoped_acquire gil;
                         // Destroyed reports the identity token in place of the function
                         nb::object subject = function != nullptr ? object_to_python(*function) : nb::cast(function_id);
                         callback(event, subject, optional_value(new_value));
                     });
                 })
            .def("clear_function_watcher", [](Runtime &self, int id) { context(self).clear_function_watcher(id); })
            .def("watch_function",
                 [](Runtime &self, int id, Object &obj) { context(self).watch_function(id, obj); })
            .def("unwatch_function",
                 [](Runtime &self, int id, Object &obj) { context(self).unwatch_function(id, obj); })
            .def("is_watching", [](const Runtime &self, int id, const Object &obj) {
                return self.watchers().is_watching(id, obj);
            })
            .def("set_unraisable_hook",
                 [](Runtime &self, std::optional<nb::callable> hook) {
                     UnraisableHook wrapped;
                     if (hook) {
                         wrapped = [hook = *hook](const ObserverFailure &failure) {
                             nb::gil_scoped_acquire gil;
                             hook(nb::cast(failure, nb::rv_policy::copy));
                         };
                     }
                     context(self).unraisable().set_hook(std::move(wrapped));
                 },
                 "hook"_a.none());

        nb::class_<WatcherTrace>(m, "WatcherTrace")
            .def(
                "__init__",
                [](WatcherTrace *self, Runtime &runtime, std::optional<std::string> filter, bool dict, bool type,
                   bool code, bool function) {
                    new (self) WatcherTrace(runtime.watchers(), filter, dict, type, code, function);
                },
                "runtime"_a, "filter"_a = nb::none(), "dict"_a = true, "type"_a = true, "code"_a = true,
                "function"_a = true, nb::keep_alive<1, 2>())
            .def("watch", &WatcherTrace::watch)
            .def("unwatch", &WatcherTrace::unwatch)
            .def_static("set_use_logger", &WatcherTrace::set_use_logger);
    }

} // namespace objwatch
