#include "sbem_stack/core/error_codes.hpp"

namespace sbem_stack::core {

int to_int(ErrorCode code) {
    return static_cast<int>(code);
}

std::optional<ErrorCode> error_code_from_int(int value) {
    switch (value) {
        case 0:
        case 101: case 102: case 103: case 104:
        case 201: case 202: case 203: case 204: case 205:
        case 301: case 302: case 303: case 304: case 305: case 306: case 307:
        case 308: case 309: case 310: case 311: case 312: case 313:
        case 401: case 402: case 403: case 404:
        case 501: case 502: case 503: case 504: case 505: case 506: case 507:
        case 508:
        case 601:
            return static_cast<ErrorCode>(value);
        default:
            return std::nullopt;
    }
}

std::string error_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "No error";

        case ErrorCode::ScriptInit: return "Control script initialization error";
        case ErrorCode::ScriptSend: return "Control channel error (command could not be sent)";
        case ErrorCode::ScriptUnresponsive: return "Control channel error (unresponsive)";
        case ErrorCode::ScriptReturnValues: return "Control channel error (return values could not be read)";

        case ErrorCode::StageXY: return "Motor error (XY target position not reached)";
        case ErrorCode::StageZ: return "Motor error (Z target position not reached)";
        case ErrorCode::StageZMoveTooLarge: return "Motor error (Z move too large)";
        case ErrorCode::Cutting: return "Cutting error";
        case ErrorCode::Sweeping: return "Sweeping error";

        case ErrorCode::ImagingInit: return "Imaging device API initialization error";
        case ErrorCode::GrabImage: return "Grab image error";
        case ErrorCode::GrabIncomplete: return "Grab incomplete error";
        case ErrorCode::FrozenFrame: return "Frozen frame error";
        case ErrorCode::ImagingUnresponsive: return "Imaging device unresponsive error";
        case ErrorCode::Eht: return "EHT error";
        case ErrorCode::BeamCurrent: return "Beam current error";
        case ErrorCode::FrameSize: return "Frame size error";
        case ErrorCode::Magnification: return "Magnification error";
        case ErrorCode::ScanRate: return "Scan rate error";
        case ErrorCode::WorkingDistance: return "WD error";
        case ErrorCode::Stigmation: return "STIG XY error";
        case ErrorCode::BeamBlanking: return "Beam blanking error";

        case ErrorCode::PrimaryDrive: return "Primary drive error";
        case ErrorCode::MirrorDrive: return "Mirror drive error";
        case ErrorCode::OverwriteFile: return "Overwrite file error";
        case ErrorCode::LoadImage: return "Load image error";

        case ErrorCode::MaxSweeps: return "Maximum sweeps error";
        case ErrorCode::OverviewOutOfRange: return "Overview image error (outside of range)";
        case ErrorCode::TileOutOfRange: return "Tile image error (outside of range)";
        case ErrorCode::SliceBySlice: return "Tile image error (slice-by-slice comparison)";
        case ErrorCode::HardwareAutofocus: return "Autofocus error (imaging device)";
        case ErrorCode::HeuristicAutofocus: return "Autofocus error (heuristic)";
        case ErrorCode::WdStigDifference: return "WD/STIG difference error";
        case ErrorCode::MetadataServer: return "Metadata server error";

        case ErrorCode::TestCase: return "Test case error";
    }
    return "Unknown error";
}

ErrorCategory error_category(ErrorCode code) {
    const int value = to_int(code);
    switch (value / 100) {
        case 0: return ErrorCategory::None;
        case 1: return ErrorCategory::ControlChannel;
        case 2: return ErrorCategory::Stage;
        case 3: return ErrorCategory::Imaging;
        case 4: return ErrorCategory::Storage;
        case 5: return ErrorCategory::Acquisition;
        default: return ErrorCategory::UserDefined;
    }
}

std::string error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::ControlChannel: return "control_channel";
        case ErrorCategory::Stage: return "stage";
        case ErrorCategory::Imaging: return "imaging";
        case ErrorCategory::Storage: return "storage";
        case ErrorCategory::Acquisition: return "acquisition";
        case ErrorCategory::UserDefined: return "user_defined";
    }
    return "unknown";
}

bool is_transient(ErrorCode code) {
    return code == ErrorCode::GrabImage ||
           code == ErrorCode::GrabIncomplete ||
           code == ErrorCode::FrozenFrame ||
           code == ErrorCode::LoadImage;
}

bool is_autofocus_error(ErrorCode code) {
    return code == ErrorCode::HardwareAutofocus ||
           code == ErrorCode::HeuristicAutofocus ||
           code == ErrorCode::WdStigDifference;
}

} // namespace sbem_stack::core
