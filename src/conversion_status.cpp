#include "conversion_status.h"

namespace {

struct StatusInfo {
    ConversionStatus status;
    const char* label;
    StatusTone tone;
};

constexpr StatusInfo kStatusTable[] = {
    {ConversionStatus::Pending,    "PENDING",    StatusTone::Neutral},
    {ConversionStatus::Selected,   "SELECTED",   StatusTone::Highlight},
    {ConversionStatus::Queued,     "QUEUED",     StatusTone::Queued},
    {ConversionStatus::Sanitizing, "SANITIZING", StatusTone::Busy},
    {ConversionStatus::Converting, "CONVERTING", StatusTone::Busy},
    {ConversionStatus::Success,    "SUCCESS",    StatusTone::Good},
    {ConversionStatus::Failed,     "FAILED",     StatusTone::Bad},
};

const StatusInfo& infoFor(ConversionStatus s)
{
    for (const StatusInfo& info : kStatusTable) {
        if (info.status == s) return info;
    }
    return kStatusTable[0];
}

} // namespace

QString statusLabel(ConversionStatus s)
{
    return QLatin1String(infoFor(s).label);
}

StatusTone statusTone(ConversionStatus s)
{
    return infoFor(s).tone;
}

bool isTerminalStatus(ConversionStatus s)
{
    return s == ConversionStatus::Success || s == ConversionStatus::Failed;
}

ConversionStatus displayStatus(ConversionStatus stored, bool selected)
{
    if (selected && stored == ConversionStatus::Pending) return ConversionStatus::Selected;
    return stored;
}
