#pragma once

#include <map>
#include <string>

#include "../archive/value.hpp"
#include "../records/audio.hpp"
#include "../records/coordinates.hpp"
#include "../runtime/ndarray.hpp"

namespace farstore {

// Free-form options forwarded untouched to a collaborator.
using CodecOptions = std::map<std::string, std::string>;

// samples: (frames, channels)
struct AudioBuffer {
  NdArray samples;
  double sample_rate{0};
};

// PCM-style audio file codec (wav, flac, ...). Implemented outside farstore.
class AudioCodec {
 public:
  virtual ~AudioCodec() = default;
  virtual AudioBuffer decode(const std::string& path, DType dtype, const CodecOptions& options) = 0;
  virtual void encode(const std::string& path, const NdArray& samples, double sample_rate,
                      const std::string& subtype, const CodecOptions& options) = 0;
  // e.g. "PCM_16" for "wav"
  virtual std::string default_subtype(const std::string& format) const = 0;
};

Signal read_audio(AudioCodec& codec, const std::string& path, DType dtype = DType::F64,
                  const CodecOptions& options = {});

// Flattens the channel shape to one axis, refuses to replace an existing
// file unless `overwrite`, and warns when the subtype clips values above 1.
// An empty subtype selects the codec default for the path's suffix.
void write_audio(AudioCodec& codec, const Signal& signal, const std::string& path,
                 const std::string& subtype = "", bool overwrite = true, const CodecOptions& options = {});

// (rows, cols) -> (cols, rows), any element type.
NdArray transpose2d(const NdArray& a);

struct SpatialRecords {
  Value audio;  // Signal or FrequencyData
  Coordinates source;
  Coordinates receiver;
};

// Converts an externally loaded spatial measurement into records.
class SpatialConverter {
 public:
  virtual ~SpatialConverter() = default;
  virtual SpatialRecords convert(const Value& measurement) = 0;
};

// Names the records "audio", "source_coordinates" and "receiver_coordinates".
// Throws Error(UnsupportedType) when audio is neither Signal nor FrequencyData.
Collection to_collection(const SpatialRecords& records);

struct TabularRecords {
  Value data;  // Signal (time domain) or FrequencyData
  Coordinates coordinates;
};

// Delimited text export parser.
class TabularReader {
 public:
  virtual ~TabularReader() = default;
  virtual TabularRecords parse(const std::string& path) = 0;
};

} // namespace farstore
