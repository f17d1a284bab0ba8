#pragma once

// Direct sandbox operations; each prints one JSON document.
int cmd_exec(int argc, char** argv);
int cmd_validate(int argc, char** argv);
int cmd_languages(int argc, char** argv);
int cmd_template(int argc, char** argv);
int cmd_batch(int argc, char** argv);
int cmd_verify_log(int argc, char** argv);
