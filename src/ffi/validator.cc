#include <ffi.h>
#include <naming_convention.h>
#include <transliterate.h>
#include <type/type_map.h>
#include <validator.h>

namespace nameguard {

using namespace pybind11::literals;

void init_ffi_validator(py::module_ &m) {
    py::enum_<NameCategory>(m, "NameCategory")
        .value("Class", NameCategory::Class)
        .value("Operation", NameCategory::Operation)
        .value("Attribute", NameCategory::Attribute)
        .value("Constant", NameCategory::Constant)
        .value("Type", NameCategory::Type);
    m.def("parse_name_category", &parseNameCategory, "str"_a);

    py::class_<SymbolRegistry>(m, "SymbolRegistry")
        .def(py::init<>())
        .def_static("qualify", &SymbolRegistry::qualify, "ns"_a, "name"_a)
        .def("declare",
             static_cast<bool (SymbolRegistry::*)(const std::string &)>(
                 &SymbolRegistry::declare),
             "qualified_name"_a)
        .def("declare",
             static_cast<bool (SymbolRegistry::*)(const std::string &,
                                                  const std::string &)>(
                 &SymbolRegistry::declare),
             "ns"_a, "name"_a)
        .def("__contains__", &SymbolRegistry::contains)
        .def("__len__", &SymbolRegistry::size)
        .def("clear", &SymbolRegistry::clear);

    m.def("transliterate", &transliterate, "text"_a);
    m.def("enforce_naming_convention", &enforceNamingConvention, "name"_a);
    m.def("is_identifier", &isIdentifier, "name"_a);
    m.def("is_keyword", &isKeyword, "name"_a);

    m.def("validate_class",
          static_cast<std::string (*)(const std::string &,
                                      const NamePredicate &,
                                      const std::string &)>(&validateClass),
          "name"_a, "exists"_a = nullptr, "ns"_a = "");
    m.def("validate_class",
          static_cast<std::string (*)(const std::string &,
                                      const SymbolRegistry &,
                                      const std::string &)>(&validateClass),
          "name"_a, "registry"_a, "ns"_a = "");
    m.def("validate_operation", &validateOperation, "name"_a);
    m.def("validate_attribute", &validateAttribute, "name"_a);
    m.def("validate_constant", &validateConstant, "name"_a);
    m.def("validate_type", &validateType, "type_name"_a);
    m.def("validate_type_hint", &validateTypeHint, "type_name"_a);
    m.def("validate_unique", &validateUnique, "name"_a, "is_free"_a,
          "suffix"_a = "");
    m.def("validate_name", &validateName, "name"_a, "category"_a,
          "exists"_a = nullptr, "ns"_a = "");
}

} // namespace nameguard
