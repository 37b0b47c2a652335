#ifndef NAME_GUARD_FFI_H
#define NAME_GUARD_FFI_H

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace nameguard {

namespace py = pybind11;

void init_ffi_except(py::module_ &m);
void init_ffi_config(py::module_ &m);
void init_ffi_validator(py::module_ &m);

} // namespace nameguard

#endif // NAME_GUARD_FFI_H
