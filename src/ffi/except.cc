#include <except.h>
#include <ffi.h>

namespace nameguard {

void init_ffi_except(py::module_ &m) {
    auto &&error = py::register_exception<Error>(m, "Error");
    py::register_exception<InvalidName>(m, "InvalidName", error.ptr());
    py::register_exception<InvalidConfig>(m, "InvalidConfig", error.ptr());
}

} // namespace nameguard
