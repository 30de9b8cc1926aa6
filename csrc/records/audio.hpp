#pragma once

#include <string>

#include "../archive/registry.hpp"
#include "../runtime/ndarray.hpp"

namespace farstore {

// Sampled time signal. time has shape (cshape..., n_samples).
struct Signal {
  NdArray time;
  double sampling_rate{44100.0};
  std::string fft_norm{"none"};
  std::string comment;

  Shape cshape() const;
  int64_t n_samples() const { return time.shape.dims.empty() ? 0 : time.shape.dims.back(); }

  bool operator==(const Signal& o) const {
    return time == o.time && sampling_rate == o.sampling_rate && fft_norm == o.fft_norm && comment == o.comment;
  }
};

// Time samples at arbitrary, not necessarily equidistant, instants.
struct TimeData {
  NdArray data;
  NdArray times;  // 1-D, length == last axis of data
  std::string comment;

  bool operator==(const TimeData& o) const { return data == o.data && times == o.times && comment == o.comment; }
};

// Spectrum at arbitrary frequencies.
struct FrequencyData {
  NdArray freq;
  NdArray frequencies;  // 1-D, length == last axis of freq
  std::string fft_norm{"none"};
  std::string comment;

  bool operator==(const FrequencyData& o) const {
    return freq == o.freq && frequencies == o.frequencies && fft_norm == o.fft_norm && comment == o.comment;
  }
};

bool is_valid_fft_norm(const std::string& norm);

CompositeKind signal_kind();
CompositeKind time_data_kind();
CompositeKind frequency_data_kind();

} // namespace farstore
