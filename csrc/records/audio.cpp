#include "audio.hpp"

#include <cmath>

namespace farstore {

static const char* const kFftNorms[] = {"none", "unitary", "amplitude", "rms", "power", "psd"};

bool is_valid_fft_norm(const std::string& norm) {
  for (const char* n : kFftNorms) if (norm == n) return true;
  return false;
}

Shape Signal::cshape() const {
  Shape s = time.shape;
  if (!s.dims.empty()) s.dims.pop_back();
  return s;
}

static void check_axis(const std::string& tag, const NdArray& data, const char* data_name,
                       const NdArray& axis, const char* axis_name) {
  if (data.shape.ndim() < 1)
    FARSTORE_THROW(MalformedArchive, tag + "." + data_name + ": needs at least one dimension");
  if (axis.shape.ndim() != 1 || !is_floating(axis.dtype))
    FARSTORE_THROW(MalformedArchive, tag + "." + axis_name + ": expected a 1-D float array, found " +
                   dtype_name(axis.dtype) + " " + axis.shape.str());
  if (axis.shape.dims[0] != data.shape.dims.back())
    FARSTORE_THROW(MalformedArchive, tag + "." + axis_name + ": length " + std::to_string(axis.shape.dims[0]) +
                   " does not match last axis of " + data_name + " " + data.shape.str());
}

static std::string require_fft_norm(const Fields& f, const std::string& tag) {
  const std::string& norm = require_str(f, tag, "fft_norm");
  if (!is_valid_fft_norm(norm)) FARSTORE_THROW(MalformedArchive, tag + ".fft_norm: unknown normalization '" + norm + "'");
  return norm;
}

static Fields encode_signal(const Signal& s) {
  return {
    {"time", s.time},
    {"sampling_rate", Generic::real(s.sampling_rate)},
    {"fft_norm", Generic::str(s.fft_norm)},
    {"comment", Generic::str(s.comment)},
  };
}

static Signal decode_signal(const Fields& f) {
  Signal s;
  s.time = require_array(f, "Signal", "time");
  if (s.time.shape.ndim() < 1 || is_complex(s.time.dtype))
    FARSTORE_THROW(MalformedArchive, std::string("Signal.time: expected real samples with at least one dimension, found ") +
                   dtype_name(s.time.dtype) + " " + s.time.shape.str());
  s.sampling_rate = require_real(f, "Signal", "sampling_rate");
  if (!(s.sampling_rate > 0) || !std::isfinite(s.sampling_rate))
    FARSTORE_THROW(MalformedArchive, "Signal.sampling_rate: must be positive, found " + std::to_string(s.sampling_rate));
  s.fft_norm = require_fft_norm(f, "Signal");
  s.comment = require_str(f, "Signal", "comment");
  return s;
}

static Fields encode_time_data(const TimeData& d) {
  return {
    {"data", d.data},
    {"times", d.times},
    {"comment", Generic::str(d.comment)},
  };
}

static TimeData decode_time_data(const Fields& f) {
  TimeData d;
  d.data = require_array(f, "TimeData", "data");
  d.times = require_array(f, "TimeData", "times");
  check_axis("TimeData", d.data, "data", d.times, "times");
  d.comment = require_str(f, "TimeData", "comment");
  return d;
}

static Fields encode_frequency_data(const FrequencyData& d) {
  return {
    {"freq", d.freq},
    {"frequencies", d.frequencies},
    {"fft_norm", Generic::str(d.fft_norm)},
    {"comment", Generic::str(d.comment)},
  };
}

static FrequencyData decode_frequency_data(const Fields& f) {
  FrequencyData d;
  d.freq = require_array(f, "FrequencyData", "freq");
  d.frequencies = require_array(f, "FrequencyData", "frequencies");
  check_axis("FrequencyData", d.freq, "freq", d.frequencies, "frequencies");
  d.fft_norm = require_fft_norm(f, "FrequencyData");
  d.comment = require_str(f, "FrequencyData", "comment");
  return d;
}

CompositeKind signal_kind() { return make_kind<Signal>("Signal", encode_signal, decode_signal); }
CompositeKind time_data_kind() { return make_kind<TimeData>("TimeData", encode_time_data, decode_time_data); }
CompositeKind frequency_data_kind() {
  return make_kind<FrequencyData>("FrequencyData", encode_frequency_data, decode_frequency_data);
}

} // namespace farstore
