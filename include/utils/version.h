#pragma once

#ifndef SEGDL_VERSION
#define SEGDL_VERSION "0.3.0"
#endif
