#pragma once

// Umbrella header: includes all diarclip pipeline types

#include "diarclip/audio_io.hpp"
#include "diarclip/clip_extractor.hpp"
#include "diarclip/clip_store.hpp"
#include "diarclip/config.hpp"
#include "diarclip/encoding.hpp"
#include "diarclip/engine.hpp"
#include "diarclip/errors.hpp"
#include "diarclip/log.hpp"
#include "diarclip/normalizer.hpp"
#include "diarclip/request_log.hpp"
#include "diarclip/segment_merge.hpp"
#include "diarclip/service.hpp"
#include "diarclip/subprocess.hpp"
#include "diarclip/telemetry.hpp"
#include "diarclip/wav.hpp"
