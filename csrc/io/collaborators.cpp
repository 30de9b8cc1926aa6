#include "collaborators.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <sys/stat.h>

namespace farstore {

NdArray transpose2d(const NdArray& a) {
  if (a.shape.ndim() != 2) FARSTORE_THROW(MalformedArchive, "transpose2d: expected 2-D array, found " + a.shape.str());
  const int64_t rows = a.shape.dims[0], cols = a.shape.dims[1];
  const size_t w = itemsize(a.dtype);
  NdArray out;
  out.dtype = a.dtype;
  out.resize(Shape{{cols, rows}});
  for (int64_t r = 0; r < rows; ++r) {
    for (int64_t c = 0; c < cols; ++c) {
      std::memcpy(&out.host[static_cast<size_t>(c * rows + r) * w], &a.host[static_cast<size_t>(r * cols + c) * w], w);
    }
  }
  return out;
}

Signal read_audio(AudioCodec& codec, const std::string& path, DType dtype, const CodecOptions& options) {
  AudioBuffer buf = codec.decode(path, dtype, options);
  if (buf.samples.shape.ndim() != 2)
    FARSTORE_THROW(MalformedArchive, "audio: codec returned " + buf.samples.shape.str() + " samples for " + path);
  if (!(buf.sample_rate > 0))
    FARSTORE_THROW(MalformedArchive, "audio: codec returned sample rate " + std::to_string(buf.sample_rate) + " for " + path);
  Signal s;
  s.time = transpose2d(buf.samples);
  s.sampling_rate = buf.sample_rate;
  return s;
}

static bool exceeds_unity(const NdArray& a) {
  if (a.dtype == DType::F64) {
    auto v = a.values<double>();
    return std::any_of(v.begin(), v.end(), [](double x) { return x > 1.0; });
  }
  if (a.dtype == DType::F32) {
    auto v = a.values<float>();
    return std::any_of(v.begin(), v.end(), [](float x) { return x > 1.0f; });
  }
  return false;
}

static std::string upper(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  return s;
}

void write_audio(AudioCodec& codec, const Signal& signal, const std::string& path,
                 const std::string& subtype, bool overwrite, const CodecOptions& options) {
  // (cshape..., n) -> (channels, n)
  NdArray data = signal.time;
  const int64_t n = signal.n_samples();
  const int64_t channels = n ? static_cast<int64_t>(data.shape.numel() / n) : signal.cshape().numel();
  data.shape = Shape{{channels, n}};
  if (signal.cshape().ndim() != 1) {
    std::cerr << "[warn] Signal flattened to " << channels << " channels.\n";
  }

  struct stat st;
  if (!overwrite && ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
    FARSTORE_THROW(Io, "file already exists, use overwrite option to disable error: " + path);
  }

  const size_t dot = path.find_last_of('.');
  const std::string format = dot == std::string::npos ? std::string() : path.substr(dot + 1);
  const std::string sub = subtype.empty() ? codec.default_subtype(format) : subtype;
  const std::string u = upper(sub);
  if (u != "FLOAT" && u != "DOUBLE" && u != "VORBIS" && exceeds_unity(data)) {
    std::cerr << "[warn] " << format << "-files of subtype " << sub << " are clipped to +/- 1.\n";
  }
  codec.encode(path, transpose2d(data), signal.sampling_rate, sub, options);
}

Collection to_collection(const SpatialRecords& records) {
  if (!records.audio.is<Signal>() && !records.audio.is<FrequencyData>())
    FARSTORE_THROW(UnsupportedType, "spatial audio must be Signal or FrequencyData, found " + records.audio.type_name());
  return {
    {"audio", records.audio},
    {"source_coordinates", records.source},
    {"receiver_coordinates", records.receiver},
  };
}

} // namespace farstore
