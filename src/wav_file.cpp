
#include "wav_file.h"
#include <cstdio>
#include <cstring>
#include <errno.h>

#define WAVE_FORMAT_PCM                      (0x0001)
#define WAVE_FORMAT_EXTENSIBLE               (0xfffe)

namespace
{

//----( little-endian reading )-----------------------------------------------

class ByteReader
{
  const uint8_t * m_pos;
  const uint8_t * const m_end;

public:

  ByteReader (const uint8_t * begin, const uint8_t * end)
    : m_pos(begin),
      m_end(end)
  {}

  size_t remaining () const { return m_end - m_pos; }
  const uint8_t * pos () const { return m_pos; }

  void skip (size_t size) { m_pos += min(size, remaining()); }

  bool tag (const char * expected)
  {
    if (remaining() < 4) return false;
    bool match = memcmp(m_pos, expected, 4) == 0;
    m_pos += 4;
    return match;
  }

  uint16_t u16 ()
  {
    if (remaining() < 2) { m_pos = m_end; return 0; }
    uint16_t result = m_pos[0] | (m_pos[1] << 8);
    m_pos += 2;
    return result;
  }

  uint32_t u32 ()
  {
    if (remaining() < 4) { m_pos = m_end; return 0; }
    uint32_t result = uint32_t(m_pos[0])
                    | (uint32_t(m_pos[1]) << 8)
                    | (uint32_t(m_pos[2]) << 16)
                    | (uint32_t(m_pos[3]) << 24);
    m_pos += 4;
    return result;
  }
};

//----( sample decoding )-----------------------------------------------------

void decode_u8 (const uint8_t * data, size_t count, float * restrict out)
{
  const float scale = 1.0f / 128;
  for (size_t i = 0; i < count; ++i) {
    out[i] = (data[i] - 128.0f) * scale;
  }
}

void decode_s16 (const uint8_t * data, size_t count, float * restrict out)
{
  const float scale = 1.0f / (1 << 15);
  for (size_t i = 0; i < count; ++i, data += 2) {
    int16_t s = int16_t(data[0] | (data[1] << 8));
    out[i] = scale * s;
  }
}

void decode_s32 (const uint8_t * data, size_t count, float * restrict out)
{
  const double scale = 1.0 / 2147483648.0;
  for (size_t i = 0; i < count; ++i, data += 4) {
    int32_t s = int32_t(uint32_t(data[0])
                      | (uint32_t(data[1]) << 8)
                      | (uint32_t(data[2]) << 16)
                      | (uint32_t(data[3]) << 24));
    out[i] = scale * s;
  }
}

//----( little-endian writing )-----------------------------------------------

class ByteWriter
{
  std::vector<uint8_t> & m_bytes;

public:

  ByteWriter (std::vector<uint8_t> & bytes) : m_bytes(bytes) {}

  void tag (const char * t) { m_bytes.insert(m_bytes.end(), t, t + 4); }
  void u8 (uint8_t x) { m_bytes.push_back(x); }
  void u16 (uint16_t x) { u8(x & 0xff); u8(x >> 8); }
  void u32 (uint32_t x) { u16(x & 0xffff); u16(x >> 16); }
};

} // anonymous namespace

//----( parsing )-------------------------------------------------------------

bool parse_wav (const std::vector<uint8_t> & bytes, WavData & wav)
{
  if (bytes.empty()) {
    WARN("empty wav file");
    return false;
  }

  ByteReader reader(& bytes[0], & bytes[0] + bytes.size());

  if (not reader.tag("RIFF")) {
    WARN("not a RIFF file");
    return false;
  }
  reader.u32(); // riff size, often wrong in the wild
  if (not reader.tag("WAVE")) {
    WARN("not a WAVE file");
    return false;
  }

  bool have_format = false;
  unsigned format = 0;
  size_t num_channels = 0;
  size_t sample_rate = 0;
  size_t bits_per_sample = 0;

  const uint8_t * data = NULL;
  size_t data_size = 0;

  while (reader.remaining() >= 8) {
    char id[5] = {0,0,0,0,0};
    memcpy(id, reader.pos(), 4);
    reader.skip(4);
    size_t chunk_size = reader.u32();

    ByteReader chunk(reader.pos(), reader.pos() + min(chunk_size,
                                                      reader.remaining()));

    if (strcmp(id, "fmt ") == 0) {
      format = chunk.u16();
      num_channels = chunk.u16();
      sample_rate = chunk.u32();
      chunk.u32(); // byte rate
      chunk.u16(); // block align
      bits_per_sample = chunk.u16();

      if (format == WAVE_FORMAT_EXTENSIBLE) {
        chunk.u16(); // extension size
        chunk.u16(); // valid bits
        chunk.u32(); // channel mask
        format = chunk.u16(); // first two bytes of the subformat guid
      }
      have_format = true;

    } else if (strcmp(id, "data") == 0) {
      data = chunk.pos();
      data_size = chunk.remaining();
      break;
    }

    reader.skip(chunk_size + (chunk_size & 1)); // chunks are word aligned
  }

  if (not have_format) {
    WARN("wav file has no fmt chunk");
    return false;
  }
  if (format != WAVE_FORMAT_PCM) {
    WARN("unsupported wav format " << format << ", only PCM is supported");
    return false;
  }
  if (num_channels == 0 or sample_rate == 0) {
    WARN("bad wav header: " << num_channels << " channels at "
         << sample_rate << " Hz");
    return false;
  }

  const size_t bytes_per_sample = (bits_per_sample + 7) / 8;
  if (bytes_per_sample != 1 and bytes_per_sample != 2
                            and bytes_per_sample != 4) {
    WARN("unsupported sample width: " << (8 * bytes_per_sample) << " bits");
    return false;
  }

  const size_t frame_size = bytes_per_sample * num_channels;
  const size_t num_frames = data ? data_size / frame_size : 0;
  if (num_frames == 0) {
    WARN("wav file has no audio frames");
    return false;
  }

  const size_t count = num_frames * num_channels;
  wav.samples.resize(count);
  switch (bytes_per_sample) {
    case 1: decode_u8(data, count, & wav.samples[0]); break;
    case 2: decode_s16(data, count, & wav.samples[0]); break;
    case 4: decode_s32(data, count, & wav.samples[0]); break;
  }

  wav.num_channels = num_channels;
  wav.sample_rate = sample_rate;
  wav.bytes_per_sample = bytes_per_sample;

  return true;
}

//----( formatting )----------------------------------------------------------

void format_wav (const WavData & wav, std::vector<uint8_t> & bytes)
{
  const size_t width = wav.bytes_per_sample;
  ASSERT(width == 1 or width == 2 or width == 4,
         "cannot write " << (8 * width) << " bit samples");
  ASSERT_LT(0, wav.num_channels);

  const size_t data_size = width * wav.samples.size();

  bytes.clear();
  ByteWriter out(bytes);

  out.tag("RIFF");
  out.u32(4 + (8 + 16) + (8 + data_size));
  out.tag("WAVE");

  out.tag("fmt ");
  out.u32(16);
  out.u16(WAVE_FORMAT_PCM);
  out.u16(wav.num_channels);
  out.u32(wav.sample_rate);
  out.u32(wav.sample_rate * wav.num_channels * width);
  out.u16(wav.num_channels * width);
  out.u16(8 * width);

  out.tag("data");
  out.u32(data_size);
  for (size_t i = 0; i < wav.samples.size(); ++i) {
    double s = clipped(wav.samples[i], -1.0, 1.0);
    switch (width) {
      case 1: out.u8(bound_to(0, 255, roundi(128 + 128 * s))); break;
      case 2: out.u16(uint16_t(bound_to(-32768, 32767, roundi(32768 * s))));
              break;
      case 4: out.u32(uint32_t(int32_t(bound_to(-2147483648.0,
                                                2147483647.0,
                                                2147483648.0 * s))));
              break;
    }
  }
  if (data_size & 1) out.u8(0);
}

//----( files )---------------------------------------------------------------

bool write_wav_file (const char * filename, const WavData & wav)
{
  std::vector<uint8_t> bytes;
  format_wav(wav, bytes);

  FILE * file = fopen(filename, "wb");
  if (not file) {
    WARN("could not open " << filename << " for writing: " << strerror(errno));
    return false;
  }

  size_t num_written = fwrite(& bytes[0], 1, bytes.size(), file);
  bool failed = (num_written != bytes.size());
  if (fclose(file)) failed = true;

  if (failed) {
    WARN("error writing wav file " << filename);
    return false;
  }

  return true;
}

bool read_wav_file (const char * filename, WavData & wav)
{
  FILE * file = fopen(filename, "rb");
  if (not file) {
    WARN("could not open wav file " << filename << ": " << strerror(errno));
    return false;
  }

  std::vector<uint8_t> bytes;
  uint8_t buffer[1 << 16];
  size_t num_read;
  while ((num_read = fread(buffer, 1, sizeof(buffer), file)) > 0) {
    bytes.insert(bytes.end(), buffer, buffer + num_read);
  }
  bool failed = ferror(file);
  fclose(file);

  if (failed) {
    WARN("error reading wav file " << filename);
    return false;
  }

  if (not parse_wav(bytes, wav)) {
    WARN("could not decode wav file " << filename);
    return false;
  }

  LOG("read wav file " << filename << ": "
      << wav.num_frames() << " frames, "
      << wav.num_channels << " channels, "
      << (8 * wav.bytes_per_sample) << " bits, "
      << wav.sample_rate << " Hz");

  return true;
}

