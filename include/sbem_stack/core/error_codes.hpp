#pragma once

#include <optional>
#include <string>

namespace sbem_stack::core {

// Numeric error taxonomy reported by an acquisition run.
// Codes are grouped by hundreds:
//   1xx control channel, 2xx stage and cutting, 3xx imaging device,
//   4xx storage, 5xx acquisition logic, 6xx user-defined.
enum class ErrorCode : int {
    None = 0,

    ScriptInit = 101,
    ScriptSend = 102,
    ScriptUnresponsive = 103,
    ScriptReturnValues = 104,

    StageXY = 201,
    StageZ = 202,
    StageZMoveTooLarge = 203,
    Cutting = 204,
    Sweeping = 205,

    ImagingInit = 301,
    GrabImage = 302,
    GrabIncomplete = 303,
    FrozenFrame = 304,
    ImagingUnresponsive = 305,
    Eht = 306,
    BeamCurrent = 307,
    FrameSize = 308,
    Magnification = 309,
    ScanRate = 310,
    WorkingDistance = 311,
    Stigmation = 312,
    BeamBlanking = 313,

    PrimaryDrive = 401,
    MirrorDrive = 402,
    OverwriteFile = 403,
    LoadImage = 404,

    MaxSweeps = 501,
    OverviewOutOfRange = 502,
    TileOutOfRange = 503,
    SliceBySlice = 504,
    HardwareAutofocus = 505,
    HeuristicAutofocus = 506,
    WdStigDifference = 507,
    MetadataServer = 508,

    TestCase = 601
};

enum class ErrorCategory {
    None,
    ControlChannel,
    Stage,
    Imaging,
    Storage,
    Acquisition,
    UserDefined
};

// Number of attempts per tile/overview for transient errors
constexpr int kMaxTransientAttempts = 3;

int to_int(ErrorCode code);

// Returns nullopt for values outside the taxonomy
std::optional<ErrorCode> error_code_from_int(int value);

std::string error_description(ErrorCode code);

ErrorCategory error_category(ErrorCode code);
std::string error_category_name(ErrorCategory category);

// 302, 303, 304 and 404 are retried before the run is paused
bool is_transient(ErrorCode code);

// Autofocus failures that block acceptance of the current tile
bool is_autofocus_error(ErrorCode code);

} // namespace sbem_stack::core
