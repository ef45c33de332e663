#pragma once

namespace pulseplot
{

// Core
struct Sample;
struct DecodeError;
struct SourceFailure;
class SampleClock;
class SampleBuffer;
class RollingWindowView;
struct ViewBounds;
struct ViewConfig;

// Acquisition
class SampleSource;
class AcquisitionLoop;
struct DrainResult;

// Runtime
class DisplaySurface;
struct ViewUpdate;
struct RunContext;
class RenderDriver;

// Configuration
struct RunConfig;

}   // namespace pulseplot
