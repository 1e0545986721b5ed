#pragma once

// Flux - Main header
// Include this to build and run simulations

#include <flux/error.h>
#include <flux/layout.h>
#include <flux/uniforms.h>
#include <flux/rules.h>
#include <flux/field.h>
#include <flux/emitter.h>
#include <flux/lifecycle.h>
#include <flux/spawn.h>
#include <flux/camera.h>
#include <flux/input.h>
#include <flux/simulation.h>
#include <flux/config.h>
#include <flux/gpu/context.h>

#ifndef FLUX_VERSION
    #define FLUX_VERSION "0.1.0"
#endif
