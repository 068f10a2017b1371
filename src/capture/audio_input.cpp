#include "capture/audio_input.h"

#include "capture/alsa_input.h"
#include "capture/file_input.h"

namespace chordlive {

const char* capture_backend_name(CaptureBackend backend) {
  switch (backend) {
    case CaptureBackend::Alsa:
      return "alsa";
    case CaptureBackend::File:
      return "file";
  }
  return "unknown";
}

std::unique_ptr<IAudioInput> create_audio_input(const CaptureConfig& config) {
  switch (config.backend) {
    case CaptureBackend::File:
      return std::make_unique<FileAudioInput>(config);
    case CaptureBackend::Alsa:
      break;
  }
  return std::make_unique<AlsaAudioInput>(config);
}

}  // namespace chordlive
