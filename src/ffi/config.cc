#include <config.h>
#include <ffi.h>

namespace nameguard {

using namespace pybind11::literals;

void init_ffi_config(py::module_ &m) {
    Config::init();

    m.def("set_werror", Config::setWerror, "flag"_a = true);
    m.def("werror", Config::werror);
    m.def("set_log_rename", Config::setLogRename, "flag"_a = true);
    m.def("log_rename", Config::logRename);
    m.def("set_name_prefix", Config::setNamePrefix, "prefix"_a);
    m.def("name_prefix", Config::namePrefix);
    m.def("set_name_suffix", Config::setNameSuffix, "suffix"_a);
    m.def("name_suffix", Config::nameSuffix);
    m.def("reset_config", Config::reset);
}

} // namespace nameguard
