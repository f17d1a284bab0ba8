#pragma once

// codeloop_cli run <request.json>
int cmd_run(int argc, char** argv);
