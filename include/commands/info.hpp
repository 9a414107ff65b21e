#pragma once

int cmd_info();
