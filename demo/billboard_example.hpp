#pragma once

// Firmware of a message billboard that receives its commands from an
// untrusted shared memory channel.
void billboard_example();
