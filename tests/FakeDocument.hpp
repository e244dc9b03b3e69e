/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>
#include <QtGui/QColor>
#include <QtGui/QImage>

#include <qtermdoc/QTermDocument.hpp>

class FakeDocument;

/*
 * A page that paints a flat colour and reports scripted text
 */
class FakePage : public QTermPage {
    public:
        FakePage( int pgNo, const FakeDocument *doc ) : QTermPage( pgNo ) {
            mDoc = doc;
        }

        void setPageData( void * ) {
        }

        QSizeF pageSize( qreal zoom = 1.0 ) const;
        QImage render( QSize size, QTermRenderOptions opts ) const;
        QTermTextOps textOps() const;

    private:
        const FakeDocument *mDoc;
};

/*
 * Deterministic document: page sizes, text, failures and latency are scripted
 */
class FakeDocument : public QTermDocument {
    Q_OBJECT;

    public:
        FakeDocument( int pages = 3, QSizeF size = QSizeF( 612, 792 ) ) : QTermDocument( "fake.pdf" ) {
            mPageCount   = pages;
            mSize        = size;
            mFailLoad    = false;
            mRenderDelay = 0;
        }

        ~FakeDocument() {
            close();
        }

        void setPassword( QString ) {
        }

        /* Takes effect on the next load() or reload() */
        void setPageCount( int pages ) {
            mPageCount = pages;
        }

        void setFailLoad( bool yes ) {
            mFailLoad = yes;
        }

        void setFailing( int page, bool yes = true ) {
            QMutexLocker locker( &mLock );

            if ( yes ) {
                mFailing << page;
            }

            else {
                mFailing.remove( page );
            }
        }

        bool isFailing( int page ) const {
            QMutexLocker locker( &mLock );

            return mFailing.contains( page );
        }

        void setPageLines( int page, QStringList lines ) {
            QMutexLocker locker( &mLock );

            mLines[ page ] = lines;
        }

        QStringList pageLines( int page ) const {
            QMutexLocker locker( &mLock );

            return mLines.value( page );
        }

        void setRenderDelay( int ms ) {
            mRenderDelay = ms;
        }

        int renderDelay() const {
            return mRenderDelay;
        }

        QSizeF fakePageSize() const {
            return mSize;
        }

        /* Rasterizations that reached a page */
        int renders() const {
            return mRenders.loadAcquire();
        }

        void countRender() const {
            mRenders.fetchAndAddOrdered( 1 );
        }

    public Q_SLOTS:
        void load() {
            mStatus = Loading;
            emit statusChanged( Loading );

            if ( mFailLoad ) {
                mStatus = Failed;
                mError  = InvalidFileFormatError;
                emit statusChanged( Failed );

                return;
            }

            for ( int i = 0; i < mPageCount; i++ ) {
                mPages << new FakePage( i, this );
            }

            bumpGeneration();

            mStatus = Ready;
            mError  = NoError;

            emit statusChanged( Ready );
            emit pageCountChanged( mPages.count() );
        }

        void close() {
            qDeleteAll( mPages );
            mPages.clear();

            mStatus = Null;
        }

    private:
        int mPageCount;
        QSizeF mSize;
        bool mFailLoad;
        int mRenderDelay;

        mutable QMutex mLock;
        QSet<int> mFailing;
        QHash<int, QStringList> mLines;

        mutable QAtomicInt mRenders;
};

inline QSizeF FakePage::pageSize( qreal zoom ) const {
    return mDoc->fakePageSize() * zoom;
}


inline QImage FakePage::render( QSize size, QTermRenderOptions ) const {
    mDoc->countRender();

    if ( mDoc->renderDelay() ) {
        QThread::msleep( mDoc->renderDelay() );
    }

    if ( mDoc->isFailing( mPageNo ) ) {
        return QImage();
    }

    QImage img( size, QImage::Format_RGBA8888 );

    img.fill( QColor::fromHsv( (mPageNo * 60) % 360, 200, 200 ) );

    return img;
}


/* One draw operation per scripted line */
inline QTermTextOps FakePage::textOps() const {
    QTermTextOps      ops;
    const QStringList lines = mDoc->pageLines( mPageNo );

    for ( int i = 0; i < lines.count(); i++ ) {
        QTermTextOp op;

        op.text    = lines.at( i );
        op.newline = (i > 0);

        ops << op;
    }

    return ops;
}
