#include "QuadFillTypes.hpp"

const char* to_string(FillError error) noexcept
{
    switch (error)
    {
        case FillError::None:
            return "None";
        case FillError::InsufficientEdges:
            return "InsufficientEdges";
        case FillError::MalformedBoundary:
            return "MalformedBoundary";
        case FillError::InvalidSpan:
            return "InvalidSpan";
        case FillError::ConstructionFailure:
            return "ConstructionFailure";
        case FillError::CommitFailure:
            return "CommitFailure";
        case FillError::InvalidState:
            return "InvalidState";
    }
    return "Unknown";
}
