#pragma once

#include <QStringList>

#include "common/config.hpp"
#include "provision/provisioning_pipeline.hpp"

namespace hostprep {

class ProvisionCli
{
public:
    // Parses arguments, layers config file, environment and flags, then runs
    // the provisioning pipeline. Returns the process exit code.
    int run(int argc, char *argv[]);

    // Returns -1 when parsing succeeded and the run should continue,
    // otherwise the exit code to stop with (help, version, bad input).
    int parseArguments(const QStringList &args, ProvisionConfig &config);

    // Runs the pipeline and turns anything it lets escape into
    // kExitInternalError once the pipeline has unwound (and written its report).
    int runPipeline(ProvisioningPipeline &pipeline);
};

} // namespace hostprep
