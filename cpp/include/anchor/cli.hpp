#pragma once

namespace anchor::cli
{

	/** Parse arguments, run one subcommand and return the process exit code */
	int run(int argc, char *argv[]);

} // namespace anchor::cli
