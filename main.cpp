
#include "MatchCommand.h"
#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

int main(int argc, char *argv[]) {

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QString::fromLatin1(MatchCommand::ApplicationName));
	QCoreApplication::setApplicationVersion(QString::fromLatin1(MatchCommand::ApplicationVersion));

	QTextStream in(stdin);
	QTextStream out(stdout);

	MatchCommand command;
	return command.exec(QCoreApplication::arguments(), in, out);
}
