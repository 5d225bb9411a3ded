
#include "MatchCommand.h"
#include "regex/Regex.h"
#include "regex/RegexReference.h"
#include <QLoggingCategory>

const char MatchCommand::ApplicationName[]    = "tinyregex-match";
const char MatchCommand::ApplicationVersion[] = "1.0";

namespace {

QStringList readLines(QTextStream &in) {
	QStringList lines;
	QString line;
	while (in.readLineInto(&line)) {
		lines << line;
	}
	return lines;
}

}

//------------------------------------------------------------------------------
// Name: MatchCommand
// Desc: '-v' belongs to --invert-match, as in grep, so the version option is
//       declared here with its long name only instead of addVersionOption().
//------------------------------------------------------------------------------
MatchCommand::MatchCommand() :
	invertOption_(QStringList() << QStringLiteral("v") << QStringLiteral("invert-match"), QStringLiteral("Select non-matching subjects.")),
	countOption_(QStringList() << QStringLiteral("c") << QStringLiteral("count"), QStringLiteral("Print only the number of selected subjects.")),
	quietOption_(QStringList() << QStringLiteral("q") << QStringLiteral("quiet"), QStringLiteral("Print nothing, only set the exit status.")),
	dumpOption_(QStringLiteral("dump"), QStringLiteral("Print the tokenized pattern before matching.")),
	referenceOption_(QStringLiteral("reference"), QStringLiteral("Use the reference string-walking matcher.")),
	debugOption_(QStringLiteral("debug"), QStringLiteral("Enable debug logging.")),
	versionOption_(QStringLiteral("version"), QStringLiteral("Displays version information.")),
	optionsAdded_(false), invert_(false), count_(false), quiet_(false), reference_(false) {

	parser_.setApplicationDescription(QStringLiteral("Print the subjects matched by a pattern made of literals, '.', '^', '$' and 'c*'."));
	parser_.addHelpOption();
	parser_.addPositionalArgument(QStringLiteral("pattern"), QStringLiteral("The regular expression."));
	parser_.addPositionalArgument(QStringLiteral("text"), QStringLiteral("Subjects to match. Lines of standard input if omitted."), QStringLiteral("[text...]"));

	optionsAdded_ = addOptions();
}

//------------------------------------------------------------------------------
// Name: addOptions
// Desc: QCommandLineParser refuses an option whose name is already taken.
//------------------------------------------------------------------------------
bool MatchCommand::addOptions() {
	const QCommandLineOption *const options[] = {
		&invertOption_, &countOption_, &quietOption_, &dumpOption_, &referenceOption_, &debugOption_, &versionOption_
	};

	for (const QCommandLineOption *option : options) {
		if (!parser_.addOption(*option)) {
			qCCritical(lcRegex, "option '%s' clashes with an existing one", qPrintable(option->names().join(QStringLiteral(", "))));
			return false;
		}
	}

	return true;
}

//------------------------------------------------------------------------------
// Name: selects
// Desc: Runs one subject through whichever matcher was asked for.
//------------------------------------------------------------------------------
bool MatchCommand::selects(const Regex &regex, const RegexMatch &matcher, const QString &subject) const {
	bool matched;
	if (reference_) {
		matched = reference_match(regex.pattern(), subject);
	} else {
		const ScalarString text = toScalars(subject);
		matched = matcher.isMatch(TextSlice(text));
	}
	return matched != invert_;
}

//------------------------------------------------------------------------------
// Name: run
// Desc: Matches each subject and prints the selected ones. Returns how many
//       were selected.
//------------------------------------------------------------------------------
int MatchCommand::run(const Regex &regex, const RegexMatch &matcher, const QStringList &subjects, QTextStream &out) const {

	int selected = 0;

	for (const QString &subject : subjects) {
		if (selects(regex, matcher, subject)) {
			++selected;
			if (!quiet_ && !count_) {
				out << subject << '\n';
			}
		}
	}

	return selected;
}

//------------------------------------------------------------------------------
// Name: exec
//------------------------------------------------------------------------------
int MatchCommand::exec(const QStringList &arguments, QTextStream &in, QTextStream &out) {

	if (!optionsAdded_) {
		return ExitTrouble;
	}

	if (!parser_.parse(arguments)) {
		qCCritical(lcRegex, "%s", qPrintable(parser_.errorText()));
		return ExitTrouble;
	}

	if (parser_.isSet(QStringLiteral("help"))) {
		out << parser_.helpText();
		return ExitMatched;
	}

	if (parser_.isSet(versionOption_)) {
		out << ApplicationName << ' ' << ApplicationVersion << '\n';
		return ExitMatched;
	}

	QStringList args = parser_.positionalArguments();
	if (args.isEmpty()) {
		qCCritical(lcRegex, "missing pattern, see --help");
		return ExitTrouble;
	}

	if (parser_.isSet(debugOption_)) {
		QLoggingCategory::setFilterRules(QStringLiteral("tinyregex.debug=true"));
	}

	invert_    = parser_.isSet(invertOption_);
	count_     = parser_.isSet(countOption_);
	quiet_     = parser_.isSet(quietOption_);
	reference_ = parser_.isSet(referenceOption_);

	const Regex regex(args.takeFirst());

	if (parser_.isSet(dumpOption_)) {
		for (const Symbol &symbol : regex.symbols()) {
			out << symbol.toString() << '\n';
		}
	}

	int selected = 0;
	try {
		// Rejects a misplaced anchor before any input is read.
		const RegexMatch matcher{SymbolSlice(regex.symbols())};

		const QStringList subjects = args.isEmpty() ? readLines(in) : args;
		selected = run(regex, matcher, subjects, out);
	} catch (const RegexException &e) {
		qCCritical(lcRegex, "%s: %s", qPrintable(regex.pattern()), e.what());
		return ExitTrouble;
	}

	if (count_ && !quiet_) {
		out << selected << '\n';
	}

	return selected > 0 ? ExitMatched : ExitNoMatch;
}
