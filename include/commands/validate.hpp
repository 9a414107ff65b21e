#pragma once

// pwf validate <files...> [--format pretty|json|compact] [--strict] [--quiet]
int cmd_validate(int argc, char** argv);

// pwf history <files...> [--format pretty|json|compact] [--strict]
int cmd_history(int argc, char** argv);
