#pragma once

// uishade - UI Shading Core
// Main include: single-source UI shaders, their generators and the CPU reference

#include <uishade/types.h>
#include <uishade/color.h>
#include <uishade/projection.h>
#include <uishade/scissor.h>
#include <uishade/config.h>
#include <uishade/parity.h>

#include <uishade/shader/binding_layout.h>
#include <uishade/shader/ir.h>
#include <uishade/shader/ui_program.h>
#include <uishade/shader/backend.h>
#include <uishade/shader/lowering.h>
#include <uishade/shader/generator.h>
#include <uishade/shader/evaluator.h>

#include <uishade/raster/texture.h>
#include <uishade/raster/rasterizer.h>
