#include "cephdu/ui/status_line.hpp"

#include "cephdu/commands.hpp"

namespace cephdu::ui
{

const char *CommandAwareStatusLine::hint(ushort helpCtx)
{
    if (helpCtx != hcNoContext)
    {
        if (const char *text = cephdu::commands::commandHint(helpCtx))
            return text;
    }
    return TStatusLine::hint(helpCtx);
}

} // namespace cephdu::ui
