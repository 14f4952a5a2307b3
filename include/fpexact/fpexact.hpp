#ifndef FPEXACT_HPP
#define FPEXACT_HPP

#include "fpexact/core/binary.hpp"
#include "fpexact/core/bits.hpp"
#include "fpexact/core/codec.hpp"
#include "fpexact/core/components.hpp"
#include "fpexact/core/convert.hpp"
#include "fpexact/core/enums.hpp"
#include "fpexact/core/errors.hpp"
#include "fpexact/core/exceptions.hpp"
#include "fpexact/core/format.hpp"
#include "fpexact/core/limits.hpp"
#include "fpexact/core/rounding.hpp"
#include "fpexact/core/split.hpp"

#endif // FPEXACT_HPP
