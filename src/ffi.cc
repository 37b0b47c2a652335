#include <ffi.h>

namespace nameguard {

PYBIND11_MODULE(nameguard_ffi, m) {
    init_ffi_except(m);
    init_ffi_config(m);
    init_ffi_validator(m);
}

} // namespace nameguard
