//SPDX-License-Identifier: MIT
#include "utility.hpp"
#include "native.hpp"
#include "hospice.hpp"
#include "lifecycle.hpp"
#include "service.hpp"

HEB_EXPORT heb::native::runtime* runtime_implementation_ = nullptr;
HEB_EXPORT heb::hospice* hospice_implementation_ = nullptr;
HEB_EXPORT heb::lifecycle* lifecycle_implementation_ = nullptr;

template <>
heb::native::runtime*& heb::service<heb::native::runtime>::ptr_ref() {
    return runtime_implementation_;
}

template <>
heb::hospice*& heb::service<heb::hospice>::ptr_ref() {
    return hospice_implementation_;
}

template <>
heb::lifecycle*& heb::service<heb::lifecycle>::ptr_ref() {
    return lifecycle_implementation_;
}
