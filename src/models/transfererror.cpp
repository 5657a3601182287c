#include "transfererror.h"

const char* validationReasonToString(ValidationError::Reason reason)
{
    switch (reason) {
        case ValidationError::Reason::None: return "None";
        case ValidationError::Reason::EmptySources: return "EmptySources";
        case ValidationError::Reason::MissingSource: return "MissingSource";
        case ValidationError::Reason::UnreadableSource: return "UnreadableSource";
        case ValidationError::Reason::MissingDestination: return "MissingDestination";
        case ValidationError::Reason::DestinationNotDirectory: return "DestinationNotDirectory";
        case ValidationError::Reason::DestinationNotWritable: return "DestinationNotWritable";
        case ValidationError::Reason::SourceParentNotWritable: return "SourceParentNotWritable";
        case ValidationError::Reason::DestinationInsideSource: return "DestinationInsideSource";
        case ValidationError::Reason::SameSourceAndDestination: return "SameSourceAndDestination";
        case ValidationError::Reason::OverlappingJob: return "OverlappingJob";
    }
    return "Unknown";
}
