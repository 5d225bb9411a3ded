
#ifndef MATCH_COMMAND_H_
#define MATCH_COMMAND_H_

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>
#include <QTextStream>

class Regex;
class RegexMatch;

enum ExitCode {
	ExitMatched = 0, // At least one subject selected.
	ExitNoMatch = 1,
	ExitTrouble = 2  // Usage error or malformed pattern.
};

/* The tinyregex-match command line: parses the options, matches every
   subject and prints the selected ones. Kept apart from main() so that it can
   be driven with in-memory streams. Each instance runs once. */
class MatchCommand {
public:
	static const char ApplicationName[];
	static const char ApplicationVersion[];

public:
	MatchCommand();
	MatchCommand(const MatchCommand &) = delete;
	MatchCommand &operator=(const MatchCommand &) = delete;

public:
	/**
	 * @brief exec - Runs the command.
	 * @param arguments - Program name followed by the command line arguments.
	 * @param in - Subjects, one per line, used when none are given as arguments.
	 * @param out - Receives the selected subjects, the count or the dump.
	 * @return one of ExitCode
	 */
	int exec(const QStringList &arguments, QTextStream &in, QTextStream &out);

private:
	bool addOptions();
	bool selects(const Regex &regex, const RegexMatch &matcher, const QString &subject) const;
	int run(const Regex &regex, const RegexMatch &matcher, const QStringList &subjects, QTextStream &out) const;

private:
	QCommandLineParser parser_;
	QCommandLineOption invertOption_;
	QCommandLineOption countOption_;
	QCommandLineOption quietOption_;
	QCommandLineOption dumpOption_;
	QCommandLineOption referenceOption_;
	QCommandLineOption debugOption_;
	QCommandLineOption versionOption_;
	bool               optionsAdded_;

	bool invert_;
	bool count_;
	bool quiet_;
	bool reference_;
};

#endif
