#ifndef SOUND_SERVER_HPP
#define SOUND_SERVER_HPP

// Asks PulseAudio to duck or cork other streams while capture streams are
// open by tagging them with media.role=phone. Takes effect for streams
// opened after the first call; later calls do nothing. Call it before the
// audio library starts threads of its own.
void requestDucking();

#endif
