#pragma once

/// @file convert.h
/// @brief Frequency, bin and frame conversions used by the extractors.

namespace bandprint {

/// @brief Converts Hz to MIDI note number (A4 = 440 Hz = 69).
/// @return MIDI note number, 0 for non-positive input
float hz_to_midi(float hz);

/// @brief Converts MIDI note number to Hz.
float midi_to_hz(float midi);

/// @brief Returns the center frequency of an FFT bin.
/// @param bin Bin index
/// @param sr Sample rate
/// @param n_fft FFT size
float bin_to_hz(int bin, int sr, int n_fft);

/// @brief Returns the nearest FFT bin for a frequency.
int hz_to_bin(float hz, int sr, int n_fft);

/// @brief Converts frame index to time in seconds.
float frames_to_time(int frames, int sr, int hop_length);

/// @brief Converts time in seconds to frame index (floor).
int time_to_frames(float time, int sr, int hop_length);

/// @brief Converts a duration to a frame count at a given frame rate (rounded).
/// @param seconds Duration in seconds
/// @param frame_rate Frames per second
int seconds_to_frames(float seconds, float frame_rate);

/// @brief Number of full analysis frames for a signal without center padding.
/// @param n_samples Signal length
/// @param n_fft Frame length
/// @param hop_length Hop between frames
/// @return Frame count, 0 if the signal is shorter than one frame
int count_frames(long long n_samples, int n_fft, int hop_length);

}  // namespace bandprint
