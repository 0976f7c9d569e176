// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "regex/Pattern.hxx"
#include "lib/fmt/PatternFormatter.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <span>

#include <stdio.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

struct Usage {};

struct CommandLine {
	RegexOptions options;
	unsigned verbose = 1;

	const char *pattern;

	std::span<char *> subjects;
};

static CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	int i = 1;
	for (; i < argc && argv[i][0] == '-'; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "-v"sv)
			++cmdline.verbose;
		else if (arg.starts_with("--options="sv))
			cmdline.options = ParseRegexOptions(arg.substr(10));
		else if (arg == "--"sv) {
			++i;
			break;
		} else
			throw Usage{};
	}

	if (argc - i < 2)
		throw Usage{};

	cmdline.pattern = argv[i++];
	cmdline.subjects = {argv + i, std::size_t(argc - i)};
	return cmdline;
}

static void
PrintMatch(const Match &m)
{
	const auto &range = m.GetRange();
	fmt::print("{}+{}: \"{}\"\n", range.start, range.size(),
		   m.GetMatchedString());

	for (std::size_t i = 0; i < m.GetCaptureCount(); ++i) {
		if (const auto capture = m.GetCapture(i))
			fmt::print("  ${}: \"{}\"\n", i + 1, *capture);
		else
			fmt::print("  ${}: (unset)\n", i + 1);
	}
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	SetLogLevel(cmdline.verbose);

	const Pattern pattern{cmdline.pattern, cmdline.options};
	LogFmt(2, "run-match", "compiled {} with {} capture groups",
	       pattern, pattern.GetCaptureCount());

	bool found = false;
	for (const char *subject : cmdline.subjects) {
		std::size_t n = 0;
		for (const auto &m : pattern.AllMatches(subject)) {
			PrintMatch(m);
			++n;
		}

		LogFmt(3, "run-match", "{} matches in '{}'", n, subject);
		if (n > 0)
			found = true;
	}

	return found ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (Usage) {
	fprintf(stderr, "usage: run-match [-v] [--options=LIST] PATTERN SUBJECT...\n");
	return EXIT_FAILURE;
} catch (const std::exception &e) {
	PrintException(e);
	return EXIT_FAILURE;
}
