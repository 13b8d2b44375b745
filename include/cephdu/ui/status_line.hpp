#pragma once

#define Uses_TStatusLine
#include <tvision/tv.h>

namespace cephdu::ui
{

class CommandAwareStatusLine : public TStatusLine
{
public:
    using TStatusLine::TStatusLine;

    const char *hint(ushort helpCtx) override;
};

} // namespace cephdu::ui
