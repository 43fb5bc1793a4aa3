/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Per-field fixed-point scales used by the compressed datagrams.
 *
 * Every floating-point field of #MRZ and #MWC that the codec quantizes has one
 * entry here: its integer width, the value of one integer step and the largest
 * magnitude it may carry. The round trip error of a field is at most half a
 * step. NaN is carried by the smallest integer of the field's width.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "Datagrams.hpp"

namespace kmall {

enum class IntWidth { I16, I32, I64 };

struct QuantizedField {
    const char *name;
    double scale;  ///< value of one integer step
    IntWidth width;
    double maxAbs; ///< largest magnitude accepted on encode and on decode

    /// Largest round trip error for a finite value
    [[nodiscard]] double tolerance() const { return scale / 2.0; }
};

/// Binds a quantized field to the float or double member holding it
template <typename T> struct FieldBinding {
    QuantizedField field;
    float T::*f32;
    double T::*f64;

    [[nodiscard]] double get(const T &object) const
    {
        return f32 != nullptr ? static_cast<double>(object.*f32) : object.*f64;
    }

    void set(T &object, double value) const
    {
        if (f32 != nullptr) {
            object.*f32 = static_cast<float>(value);
        } else {
            object.*f64 = value;
        }
    }
};

[[nodiscard]] const std::vector<FieldBinding<MrzPingInfo>> &pingInfoFields();
[[nodiscard]] const std::vector<FieldBinding<MrzTxSector>> &mrzTxSectorFields();
[[nodiscard]] const std::vector<FieldBinding<MrzRxInfo>> &mrzRxInfoFields();
[[nodiscard]] const std::vector<FieldBinding<MrzSounding>> &soundingFields();
[[nodiscard]] const std::vector<FieldBinding<MwcTxInfo>> &mwcTxInfoFields();
[[nodiscard]] const std::vector<FieldBinding<MwcTxSector>> &mwcTxSectorFields();
[[nodiscard]] const std::vector<FieldBinding<MwcRxInfo>> &mwcRxInfoFields();
[[nodiscard]] const std::vector<FieldBinding<MwcBeam>> &mwcBeamFields();

/// Integer that stands for NaN in a field of the given width
[[nodiscard]] int64_t nanSentinel(IntWidth width);

/**
 * @throws KmallError QuantizationOverflow if |value| exceeds field.maxAbs or
 *         the value is infinite
 */
[[nodiscard]] int64_t quantize(const QuantizedField &field, double value);

/**
 * @throws KmallError CorruptCompressedStream if the decoded magnitude exceeds
 *         field.maxAbs
 */
[[nodiscard]] double dequantize(const QuantizedField &field, int64_t stored);

} // namespace kmall
