#pragma once

#include <QString>

#include "common/models.hpp"

namespace hashprint {

class RewindCli
{
public:
    // Parses argv, reconciles the requested root and prints a summary.
    // returns exit code: 0 on success, 1 on usage errors, 2 when the run failed
    int run(int argc, char *argv[]);

private:
    int runReconcile(const QString &root, bool dryRun, const QString &format);

    void renderText(const ReconcileSummary &summary) const;
    void renderJson(const ReconcileSummary &summary) const;
};

} // namespace hashprint
