#ifndef SIMPLIFY_COMMAND_HPP__
#define SIMPLIFY_COMMAND_HPP__

#include <QStringList>

namespace SimplifyCommand
{
  // Exit status values.

  enum Status
  {
    Success = 0,
    Usage   = 1,
    IO      = 2
  };

  // Run the rdpsimplify command line; the first argument is the program
  // name. Settings come from the INI file named by --config if there is
  // one, the application's usual settings otherwise, and options given
  // on the command line override them.
  //
  // Input is read from the named file, or standard input if the name is
  // absent or '-'; output goes to the --output file, or standard output.

  Status
  run(QStringList const & arguments);
}

#endif
