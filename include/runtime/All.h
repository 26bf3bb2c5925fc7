/***
 * Name: pybuf::rt umbrella header
 * Purpose: Aggregate the runtime object layer, providers and the buffer protocol
 *          for embedders, tools and tests.
 */
#pragma once

#include "runtime/TypeTag.h"
#include "runtime/Config.h"
#include "runtime/Log.h"
#include "runtime/BufferStats.h"
#include "runtime/Object.h"
#include "runtime/VecBuffer.h"
#include "runtime/Bytes.h"
#include "runtime/ResizableBytes.h"
#include "runtime/ByteArray.h"
#include "runtime/Array.h"
#include "buffer/BufferDescriptor.h"
#include "buffer/ManagedBuffer.h"
#include "buffer/ResizeGuard.h"
#include "buffer/Algorithms.h"
