#include <QCoreApplication>
#include "SimplifyCommand.hpp"

int
main(int    argc,
     char * argv[])
{
  QCoreApplication app {argc, argv};

  QCoreApplication::setOrganizationName("rdp");
  QCoreApplication::setApplicationName("rdpsimplify");

  return SimplifyCommand::run(QCoreApplication::arguments());
}
