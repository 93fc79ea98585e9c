
#ifndef VOWELPAD_WAV_FILE_H
#define VOWELPAD_WAV_FILE_H

/** Reads RIFF/WAVE files of linear PCM.

  Input: 8-bit unsigned, 16-bit or 32-bit signed little-endian samples,
    any number of interleaved channels, any sample rate.
    WAVE_FORMAT_EXTENSIBLE is accepted when its subformat is PCM.
  Output: interleaved float samples in [-1,1]
    u8  --> (u - 128) / 128
    s16 --> s / 2^15
    s32 --> s / 2^31

  Anything else (24-bit, float, compressed formats, zero frames,
  broken headers) is refused with a warning, and the caller gets false.

  References:
  (R1) http://soundfile.sapp.org/doc/WaveFormat/
*/

#include "common.h"
#include <vector>

struct WavData
{
  std::vector<float> samples; // interleaved
  size_t num_channels;
  size_t sample_rate;
  size_t bytes_per_sample;

  WavData () : samples(), num_channels(0), sample_rate(0), bytes_per_sample(0)
  {}

  size_t num_frames () const
  {
    return num_channels ? samples.size() / num_channels : 0;
  }
  double duration () const
  {
    return sample_rate ? double(num_frames()) / sample_rate : 0.0;
  }
};

// returns true if the whole file was understood
bool read_wav_file (const char * filename, WavData & wav);

// parses an in-memory image of a .wav file
bool parse_wav (const std::vector<uint8_t> & bytes, WavData & wav);

// writes PCM at wav.bytes_per_sample, clipping samples to [-1,1]
bool write_wav_file (const char * filename, const WavData & wav);
void format_wav (const WavData & wav, std::vector<uint8_t> & bytes);

#endif // VOWELPAD_WAV_FILE_H

