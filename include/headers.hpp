#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "app/command_dispatch.hpp"
#include "app/controller.hpp"
#include "app/file_transcription.hpp"
#include "app/utterance_sink.hpp"
#include "audio/portaudio_capture.hpp"
#include "audio/voice_classifier.hpp"
#include "config/app_config.hpp"
#include "control/control_server.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "inject/console_injector.hpp"
#include "inject/xdo_injector.hpp"
#include "stt/whisper_stt.hpp"

#endif
